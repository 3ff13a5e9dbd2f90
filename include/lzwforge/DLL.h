/* Copyright (c) 2024-2026 The lzwforge Authors
 *
 * This file is part of lzwforge.
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
 * in compliance with the License. You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License
 * is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
 * or implied. See the License for the specific language governing permissions and limitations under
 * the License.
 */

#ifndef LZWFORGE_DLL_HH
#define LZWFORGE_DLL_HH

#define LZWFORGE_MAJOR_VERSION 1
#define LZWFORGE_MINOR_VERSION 0
#define LZWFORGE_PATCH_VERSION 0
#define LZWFORGE_VERSION "1.0.0"

/*
 * Only symbols marked with LZWFORGE_DLL are part of the public ABI of the shared library. Classes
 * that are derived from, thrown, or used with dynamic_cast across the library boundary are marked
 * with LZWFORGE_DLL_CLASS so that their runtime type information is exported. Anything declared
 * LZWFORGE_DLL_PRIVATE stays hidden even inside an exported class.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef liblzwforge_EXPORTS
#  define LZWFORGE_DLL __declspec(dllexport)
# else
#  define LZWFORGE_DLL
# endif
# define LZWFORGE_DLL_PRIVATE
#elif defined __GNUC__
# define LZWFORGE_DLL __attribute__((visibility("default")))
# define LZWFORGE_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define LZWFORGE_DLL
# define LZWFORGE_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define LZWFORGE_DLL_CLASS LZWFORGE_DLL
#else
# define LZWFORGE_DLL_CLASS
#endif

#endif /* LZWFORGE_DLL_HH */
