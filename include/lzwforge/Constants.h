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

#ifndef LZWFORGE_CONSTANTS_H
#define LZWFORGE_CONSTANTS_H

/* New values must be added to the end so that no constant's numerical value changes. */

/* Exit codes from the lzwforge CLI */

enum lzwforge_exit_code_e {
    lzwforge_exit_success = 0,
    lzwforge_exit_error = 2,
    /* Output was written, but verification of the packed codes failed */
    lzwforge_exit_warning = 3,
};

/* How to pad the final partial byte of a packed bitstream */

enum lzwforge_padding_e {
    lzwforge_pad_aligned = 0, /* pad only when the bitstream is not byte aligned */
    lzwforge_pad_always,      /* pad 8 - (bits % 8) bits; a full zero byte when aligned */
};

/* What to do with a code whose value does not fit in its segment's width */

enum lzwforge_overflow_e {
    lzwforge_overflow_expand = 0, /* emit the full binary representation, which is longer */
    lzwforge_overflow_truncate,   /* emit only the low-order width bits */
    lzwforge_overflow_strict,     /* throw CodeWidthOverflow */
};

#endif /* LZWFORGE_CONSTANTS_H */
