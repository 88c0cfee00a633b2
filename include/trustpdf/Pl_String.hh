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

// End-of-line pipeline that appends everything written to it to a caller-owned string. Used to
// capture logger output.

#ifndef PL_STRING_HH
#define PL_STRING_HH

#include <trustpdf/Pipeline.hh>

#include <string>

class TRUSTPDF_DLL_CLASS Pl_String: public Pipeline
{
  public:
    // s must outlive the pipeline.
    TRUSTPDF_DLL
    Pl_String(std::string& s);
    TRUSTPDF_DLL
    ~Pl_String() override;

    TRUSTPDF_DLL
    void write(char const* data, size_t len) override;
    TRUSTPDF_DLL
    void finish() override;

  private:
    std::string& s;
};

#endif // PL_STRING_HH
