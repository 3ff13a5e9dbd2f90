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

#ifndef LZWFORGE_TYPES_H
#define LZWFORGE_TYPES_H

/* Byte counts and bit counts that may exceed what size_t can address on 32-bit systems. */
typedef long long int lzwforge_offset_t;

#endif /* LZWFORGE_TYPES_H */
