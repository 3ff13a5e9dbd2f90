// Copyright (c) 2024-2026 The lzwforge Authors
//
// This file is part of lzwforge.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef LFUTIL_HH
#define LFUTIL_HH

#include <lzwforge/DLL.h>

#include <cstdio>
#include <string>

namespace LFUtil
{
    // This is a collection of useful utility functions that don't really go anywhere else.

    // Convert num to a string in the given base. base may be 2, 8, 10, or 16. If length is
    // positive and the converted value is shorter, prepend zeroes to fill length. If length is
    // negative and the value is shorter than -length, append spaces. The representation is never
    // truncated, so a value that needs more digits than length is returned whole; this is the
    // formatting rule the packer's expand overflow mode follows.
    LZWFORGE_DLL
    std::string uint_to_string(unsigned long long, int length = 0);
    LZWFORGE_DLL
    std::string uint_to_string_base(unsigned long long, int base, int length = 0);

    // Convert a decimal string to an unsigned integer. Leading whitespace is allowed. Throws
    // std::runtime_error on a negative value, overflow, or trailing characters that are not
    // digits.
    LZWFORGE_DLL
    unsigned long long string_to_ull(char const* str);

    // Throw LFSystemError, which is derived from std::runtime_error, with a string formed by
    // appending to "description: " the standard string corresponding to the current value of
    // errno.
    LZWFORGE_DLL
    void throw_system_error(std::string const& description);

    // If the open fails, throws LFSystemError. Otherwise, the FILE* is returned.
    LZWFORGE_DLL
    FILE* safe_fopen(char const* filename, char const* mode);

    // The FILE* argument is assumed to be the return of fopen. If null, throw LFSystemError.
    // Otherwise, return the FILE* argument.
    LZWFORGE_DLL
    FILE* fopen_wrapper(std::string const&, FILE*);

    // Helper for closing files automatically:
    //
    // LFUtil::FileCloser fc(LFUtil::safe_fopen(filename, "wb"));
    //
    // Be sure to actually declare a variable of type FileCloser. Using it as a temporary closes the
    // file immediately.
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

        // Close the file now and report failure, which flushes pending output. The destructor
        // cannot report errors.
        LZWFORGE_DLL
        void close(std::string const& description);

        FILE* f;
    };

    // Return a lower-case hexadecimal representation of the bytes of a string.
    LZWFORGE_DLL
    std::string hex_encode(std::string const&);

    // Set stdout to binary mode. This has no effect on non-Windows platforms.
    LZWFORGE_DLL
    void binary_stdout();

    // Return the last path element of argv[0], without any .exe suffix.
    LZWFORGE_DLL
    char* getWhoami(char* argv0);

    // Get the value of an environment variable in a portable fashion. Returns true iff the
    // variable is defined. If value is not null, it is initialized with the value of the variable.
    LZWFORGE_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);
} // namespace LFUtil

#endif // LFUTIL_HH
