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

#ifndef TPDFUSAGE_HH
#define TPDFUSAGE_HH

#include <trustpdf/DLL.h>

#include <stdexcept>
#include <string>

// Thrown for command-line and configuration errors. The message is suitable for showing to the
// user followed by a hint about how to get help.
class TRUSTPDF_DLL_CLASS TPDFUsage: public std::runtime_error
{
  public:
    TRUSTPDF_DLL
    TPDFUsage(std::string const& msg);
    TRUSTPDF_DLL
    ~TPDFUsage() noexcept override = default;
};

#endif // TPDFUSAGE_HH
