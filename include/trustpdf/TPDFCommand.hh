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

#ifndef TPDFCOMMAND_HH
#define TPDFCOMMAND_HH

#include <trustpdf/DLL.h>

#include <memory>
#include <string>
#include <vector>

// An external program invocation. Arguments are passed to the program directly as an argument
// vector; nothing is interpreted by a shell, so file names may contain any characters.
class TPDFCommand
{
  public:
    // program should be a path to an executable, as returned by TPDFDependencies. It is also
    // used as argv[0].
    TRUSTPDF_DLL
    TPDFCommand(std::string const& program, std::vector<std::string> const& args);

    TRUSTPDF_DLL
    std::string const& getProgram() const;
    TRUSTPDF_DLL
    std::vector<std::string> const& getArgs() const;

    // Return the command line with each word quoted for a POSIX shell where needed, so it can be
    // pasted into a terminal to reproduce a failure.
    TRUSTPDF_DLL
    std::string unparse() const;

    // Run the program and wait for it to finish. Standard input is /dev/null and standard output
    // is discarded. Standard error is discarded unless show_errors is true. Returns the exit
    // status of the program, 128 + signal number if it was killed by a signal, or 127 if it
    // could not be executed. Throws TPDFSystemError if the process can't be created.
    TRUSTPDF_DLL
    int run(bool show_errors = false) const;

    // Quote one word for a POSIX shell. Words made only of safe characters are returned as is.
    TRUSTPDF_DLL
    static std::string shell_quote(std::string const&);

  private:
    class Members
    {
        friend class TPDFCommand;

      public:
        ~Members() = default;

      private:
        Members(std::string const& program, std::vector<std::string> const& args);
        Members(Members const&) = delete;

        std::string program;
        std::vector<std::string> args;
    };
    std::shared_ptr<Members> m;
};

#endif // TPDFCOMMAND_HH
