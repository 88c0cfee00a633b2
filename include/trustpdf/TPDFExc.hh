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

#ifndef TPDFEXC_HH
#define TPDFEXC_HH

#include <trustpdf/Constants.h>
#include <trustpdf/DLL.h>

#include <stdexcept>
#include <string>

// Raised when a conversion cannot proceed: a required program is missing, the input is not
// usable, an external stage failed, or the process was interrupted. The error code says which.
class TRUSTPDF_DLL_CLASS TPDFExc: public std::runtime_error
{
  public:
    TRUSTPDF_DLL
    TPDFExc(
        tpdf_error_code_e error_code, std::string const& filename, std::string const& message);
    TRUSTPDF_DLL
    ~TPDFExc() noexcept override = default;

    // what() combines the file name and message. The accessors return the values the exception
    // was created with. filename may be empty.
    TRUSTPDF_DLL
    tpdf_error_code_e getErrorCode() const;
    TRUSTPDF_DLL
    std::string const& getFilename() const;
    TRUSTPDF_DLL
    std::string const& getMessageDetail() const;

  private:
    TRUSTPDF_DLL_PRIVATE
    static std::string createWhat(std::string const& filename, std::string const& message);

    tpdf_error_code_e error_code;
    std::string filename;
    std::string message;
};

#endif // TPDFEXC_HH
