// Copyright (c) 2024 The trustpdf Authors
//
// This file is part of trustpdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef TPDFSCRATCHDIR_HH
#define TPDFSCRATCHDIR_HH

#include <trustpdf/DLL.h>

#include <memory>
#include <string>

class TPDFLogger;

// A private temporary directory that exists for the lifetime of the object. It is created under
// $TMPDIR (or /tmp) with a unique name and removed, with everything in it, by the destructor. The
// destructor never throws; if removal fails, a warning is written to the logger.
class TPDFScratchDir
{
  public:
    TRUSTPDF_DLL
    TPDFScratchDir(std::string const& prefix, std::shared_ptr<TPDFLogger> log = nullptr);
    TRUSTPDF_DLL
    ~TPDFScratchDir();
    TPDFScratchDir(TPDFScratchDir const&) = delete;
    TPDFScratchDir& operator=(TPDFScratchDir const&) = delete;

    TRUSTPDF_DLL
    std::string const& getPath() const;

    // Return the path of name inside the directory.
    TRUSTPDF_DLL
    std::string file(std::string const& name) const;

  private:
    std::string path;
    std::shared_ptr<TPDFLogger> log;
};

#endif // TPDFSCRATCHDIR_HH
