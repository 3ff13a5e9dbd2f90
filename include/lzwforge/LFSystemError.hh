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

#ifndef LFSYSTEMERROR_HH
#define LFSYSTEMERROR_HH

#include <lzwforge/DLL.h>

#include <stdexcept>
#include <string>

// Thrown for failures of operating system calls, such as opening or writing the fixture file.
class LZWFORGE_DLL_CLASS LFSystemError: public std::runtime_error
{
  public:
    LZWFORGE_DLL
    LFSystemError(std::string const& description, int system_errno);
    LZWFORGE_DLL
    ~LFSystemError() noexcept override = default;

    LZWFORGE_DLL
    std::string const& getDescription() const;
    LZWFORGE_DLL
    int getErrno() const;

  private:
    static std::string createWhat(std::string const& description, int system_errno);

    std::string description;
    int system_errno;
};

#endif // LFSYSTEMERROR_HH
