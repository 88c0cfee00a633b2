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

// End-of-line pipeline that writes its data to a std::ostream.

#ifndef PL_OSTREAM_HH
#define PL_OSTREAM_HH

#include <trustpdf/Pipeline.hh>

#include <iostream>

//
// This pipeline is reusable.
//

class TRUSTPDF_DLL_CLASS Pl_OStream: public Pipeline
{
  public:
    // os is externally maintained; this class just writes to and flushes it. It does not close
    // it.
    TRUSTPDF_DLL
    Pl_OStream(std::ostream& os);
    TRUSTPDF_DLL
    ~Pl_OStream() override;

    TRUSTPDF_DLL
    void write(char const* data, size_t len) override;
    TRUSTPDF_DLL
    void finish() override;

    // True if the stream is std::cout or std::cerr and the corresponding file descriptor is a
    // terminal. Used by TPDFLogger to decide whether to colour markers.
    TRUSTPDF_DLL
    bool isTerminal() const;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_OSTREAM_HH
