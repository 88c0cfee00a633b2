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

// End-of-line pipeline that discards its data. TPDFLogger hands it out so a channel can be
// silenced.

#ifndef PL_DISCARD_HH
#define PL_DISCARD_HH

#include <trustpdf/Pipeline.hh>

class TRUSTPDF_DLL_CLASS Pl_Discard: public Pipeline
{
  public:
    TRUSTPDF_DLL
    Pl_Discard() = default;
    TRUSTPDF_DLL
    ~Pl_Discard() override;
    TRUSTPDF_DLL
    void write(char const*, size_t) override;
    TRUSTPDF_DLL
    void finish() override;
};

#endif // PL_DISCARD_HH
