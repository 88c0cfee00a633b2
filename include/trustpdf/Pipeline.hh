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

// Text sink for TPDFLogger channels. By convention, subclasses of Pipeline are called
// Pl_Something. A channel is written with << and flushed with finish(); a message may reach its
// destination in several write calls, so call finish() once the text is complete.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <trustpdf/DLL.h>

#include <cstddef>
#include <memory>
#include <string>

// Remember to use TRUSTPDF_DLL_CLASS on anything derived from Pipeline so it will work with
// dynamic_cast across the shared object boundary.
class TRUSTPDF_DLL_CLASS Pipeline
{
  public:
    TRUSTPDF_DLL
    Pipeline() = default;
    TRUSTPDF_DLL
    virtual ~Pipeline() = default;

    TRUSTPDF_DLL
    virtual void write(char const* data, size_t len) = 0;
    TRUSTPDF_DLL
    virtual void finish() = 0;

    // This allows *p << "x" << 3 but is not intended to be a general purpose << compatible with
    // ostream.
    TRUSTPDF_DLL
    Pipeline& operator<<(char const* cstr);
    TRUSTPDF_DLL
    Pipeline& operator<<(std::string const&);
    TRUSTPDF_DLL
    Pipeline& operator<<(int);

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;
};

#endif // PIPELINE_HH
