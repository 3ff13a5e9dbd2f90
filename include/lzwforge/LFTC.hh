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

#ifndef LFTC_HH
#define LFTC_HH

#include <lzwforge/DLL.h>

// Test coverage hooks. A call to LFTC::TC records that a particular case was reached. Recording
// happens only when the TC_SCOPE environment variable matches scope and TC_FILENAME names a file,
// to which "case n" lines are appended once each.
//
// Defining LZWFORGE_DISABLE_LFTC compiles out LFTC::TC calls in any code that includes this file,
// but TC_real is still built into the library.

namespace LFTC
{
    LZWFORGE_DLL
    void TC_real(char const* const scope, char const* const ccase, int n = 0);

    inline void
    TC(char const* const scope, char const* const ccase, int n = 0)
    {
#ifndef LZWFORGE_DISABLE_LFTC
        TC_real(scope, ccase, n);
#endif // LZWFORGE_DISABLE_LFTC
    }
} // namespace LFTC

#endif // LFTC_HH
