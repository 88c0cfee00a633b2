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

#ifndef TUTIL_HH
#define TUTIL_HH

#include <trustpdf/DLL.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

// Utility functions for file system access and process setup. Anything that fails at the
// operating system level throws TPDFSystemError.
namespace TUtil
{
    // Convert a string of decimal digits. Throws std::range_error on overflow or underflow.
    TRUSTPDF_DLL
    long long string_to_ll(char const* str);
    TRUSTPDF_DLL
    int string_to_int(char const* str);

    // Throw TPDFSystemError with the given description and the current value of errno.
    TRUSTPDF_DLL
    void throw_system_error(std::string const& description);

    // If status is -1, convert the current value of errno to a TPDFSystemError exception.
    // Otherwise, return status.
    TRUSTPDF_DLL
    int os_wrapper(std::string const& description, int status);

    // If the open fails, throws TPDFSystemError. Otherwise, the FILE* is returned.
    TRUSTPDF_DLL
    FILE* safe_fopen(char const* filename, char const* mode);

    // The FILE* argument is assumed to be the return of fopen. If null, throw an exception.
    // Otherwise, return the FILE* argument.
    TRUSTPDF_DLL
    FILE* fopen_wrapper(std::string const&, FILE*);

    // This is a little class to help with automatic closing files. You can do something like
    //
    // FILE* f = TUtil::safe_fopen(...);
    // FileCloser fc(f);
    //
    // and f will be closed when fc goes out of scope.
    class FileCloser
    {
      public:
        FileCloser(FILE* f) :
            f(f)
        {
        }

        ~FileCloser()
        {
            if (f) {
                fclose(f);
                f = nullptr;
            }
        }

      private:
        FILE* f;
    };

    // True if the path names an existing regular file (following symbolic links).
    TRUSTPDF_DLL
    bool is_regular_file(char const* path);

    // True if the path names an existing directory.
    TRUSTPDF_DLL
    bool is_directory(char const* path);

    // True if the path names a regular file that the current user may execute.
    TRUSTPDF_DLL
    bool is_executable(char const* path);

    // Store the size of the file in *size and return true. Return false if the size can't be
    // determined; *size is left alone in that case.
    TRUSTPDF_DLL
    bool get_file_size(char const* path, unsigned long long* size);

    // True if both names refer to the same existing file.
    TRUSTPDF_DLL
    bool same_file(char const* name1, char const* name2);

    TRUSTPDF_DLL
    void remove_file(char const* path);

    TRUSTPDF_DLL
    void rename_file(char const* oldname, char const* newname);

    // Copy the contents of one file to another, replacing the destination.
    TRUSTPDF_DLL
    void copy_file(char const* from, char const* to);

    // Move a file. Uses rename when possible. If source and destination are on different file
    // systems, the data is copied to a temporary file in the destination directory, which is
    // then renamed over the destination, so the destination is never seen partially written.
    // Either way the destination ends up with the source's permission bits.
    TRUSTPDF_DLL
    void move_file(char const* oldname, char const* newname);

    // Return the last path element. Trailing slashes are ignored.
    TRUSTPDF_DLL
    std::string path_basename(std::string const& filename);

    // Return everything before the last path element, or "." if there is none.
    TRUSTPDF_DLL
    std::string path_dirname(std::string const& filename);

    // Return the names of the entries in a directory, excluding "." and "..", in no particular
    // order.
    TRUSTPDF_DLL
    std::vector<std::string> list_directory(char const* path);

    // Create a new, uniquely named directory readable only by the current user and return its
    // path. The directory is created in $TMPDIR if set, otherwise in /tmp. The last path element
    // starts with prefix.
    TRUSTPDF_DLL
    std::string make_temp_directory(char const* prefix);

    // Remove a file or a directory and everything in it. Symbolic links are removed, not
    // followed. A path that does not exist is not an error.
    TRUSTPDF_DLL
    void remove_recursively(char const* path);

    // Read up to length bytes from the beginning of a file.
    TRUSTPDF_DLL
    std::string read_file_prefix(char const* filename, size_t length);

    TRUSTPDF_DLL
    void setLineBuf(FILE*);

    // May modify argv0
    TRUSTPDF_DLL
    char* getWhoami(char* argv0);

    // Get the value of an environment variable in a portable fashion. Returns true iff the
    // variable is defined. If `value' is non-null, initializes it with the value of the variable.
    TRUSTPDF_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);

    TRUSTPDF_DLL
    inline bool is_digit(char);
    TRUSTPDF_DLL
    inline bool is_space(char);
}; // namespace TUtil

inline bool
TUtil::is_digit(char ch)
{
    return ((ch >= '0') && (ch <= '9'));
}

inline bool
TUtil::is_space(char ch)
{
    return (ch && (strchr(" \f\n\r\t\v", ch) != nullptr));
}

#endif // TUTIL_HH
