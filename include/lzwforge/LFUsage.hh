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

#ifndef LFUSAGE_HH
#define LFUSAGE_HH

#include <lzwforge/DLL.h>

#include <stdexcept>
#include <string>

// Thrown for command-line errors. The message is shown to the user along with usage information.
class LZWFORGE_DLL_CLASS LFUsage: public std::runtime_error
{
  public:
    LZWFORGE_DLL
    LFUsage(std::string const& msg);
    LZWFORGE_DLL
    ~LFUsage() noexcept override = default;
};

#endif // LFUSAGE_HH
