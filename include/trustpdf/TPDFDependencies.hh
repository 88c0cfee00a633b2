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

#ifndef TPDFDEPENDENCIES_HH
#define TPDFDEPENDENCIES_HH

#include <trustpdf/DLL.h>

#include <memory>
#include <string>
#include <vector>

// Locates the external programs a conversion needs: ImageMagick, which rasterizes pages and
// reassembles them, and Ghostscript, which optimizes the result. The search path is walked once,
// when the object is created; the resolved paths are used for every later invocation.
class TPDFDependencies
{
  public:
    // Search the directories named in the PATH environment variable.
    TRUSTPDF_DLL
    TPDFDependencies();

    // Search the given colon-separated list of directories. An empty entry means the current
    // directory.
    TRUSTPDF_DLL
    TPDFDependencies(std::string const& search_path);

    // Return the path of the first executable regular file called name in search_path, or an
    // empty string.
    TRUSTPDF_DLL
    static std::string findProgram(std::string const& name, std::string const& search_path);

    // Path to ImageMagick. "magick" (ImageMagick 7) is preferred over "convert" (ImageMagick 6).
    // Empty if neither was found.
    TRUSTPDF_DLL
    std::string const& getRasterizer() const;

    // Path to Ghostscript, or empty if it was not found.
    TRUSTPDF_DLL
    std::string const& getOptimizer() const;

    // Names of the packages that provide the missing programs, in a form suitable for a package
    // manager command line.
    TRUSTPDF_DLL
    std::vector<std::string> getMissing() const;

    // The command that installs the given packages on this platform.
    TRUSTPDF_DLL
    static std::string installCommand(std::vector<std::string> const& packages);

    // Throw TPDFExc with tpdf_e_dependency if anything is missing.
    TRUSTPDF_DLL
    void check() const;

  private:
    void locate(std::string const& search_path);

    class Members
    {
        friend class TPDFDependencies;

      public:
        ~Members() = default;

      private:
        Members() = default;
        Members(Members const&) = delete;

        std::string rasterizer;
        std::string optimizer;
    };
    std::shared_ptr<Members> m;
};

#endif // TPDFDEPENDENCIES_HH
