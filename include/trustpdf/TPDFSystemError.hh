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

#ifndef TPDFSYSTEMERROR_HH
#define TPDFSYSTEMERROR_HH

#include <trustpdf/DLL.h>

#include <stdexcept>
#include <string>

class TRUSTPDF_DLL_CLASS TPDFSystemError: public std::runtime_error
{
  public:
    TRUSTPDF_DLL
    TPDFSystemError(std::string const& description, int system_errno);
    TRUSTPDF_DLL
    ~TPDFSystemError() noexcept override = default;

    // To get a complete error string, call what(), provided by std::exception. The accessors
    // below return the original values used to create the exception.

    TRUSTPDF_DLL
    std::string const& getDescription() const;
    TRUSTPDF_DLL
    int getErrno() const;

  private:
    TRUSTPDF_DLL_PRIVATE
    static std::string createWhat(std::string const& description, int system_errno);

    std::string description;
    int system_errno;
};

#endif // TPDFSYSTEMERROR_HH
