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

#ifndef CODESEGMENT_HH
#define CODESEGMENT_HH

#include <lzwforge/DLL.h>

#include <cstddef>
#include <string>
#include <vector>

// A contiguous run of codes that share one bit width. The whole code list is emitted repeat times,
// which lets a raw bit pattern repeated hundreds of thousands of times be described by a single
// code. Codes may be larger than the width can represent; what happens to them is decided by the
// packer's overflow mode, not here.
class CodeSegment
{
  public:
    static constexpr size_t max_width = 64;

    // Throws std::logic_error if width is 0 or greater than max_width.
    LZWFORGE_DLL
    CodeSegment(size_t width, std::vector<unsigned long long> codes, unsigned long long repeat = 1);

    // Codes first through last inclusive. Throws std::logic_error if first > last.
    LZWFORGE_DLL
    static CodeSegment range(size_t width, unsigned long long first, unsigned long long last);

    // A raw bit pattern such as "111111111111" repeated repeat times. The width is the length of
    // the pattern. Throws std::logic_error if the pattern is empty, longer than max_width, or
    // contains characters other than 0 and 1.
    LZWFORGE_DLL
    static CodeSegment fromBitPattern(std::string const& pattern, unsigned long long repeat);

    LZWFORGE_DLL
    size_t getWidth() const;
    LZWFORGE_DLL
    std::vector<unsigned long long> const& getCodes() const;
    LZWFORGE_DLL
    unsigned long long getRepeat() const;

    // Replace the code at index. Throws std::logic_error if index is out of range.
    LZWFORGE_DLL
    void setCode(size_t index, unsigned long long value);

    // Number of codes emitted: the size of the code list times repeat. Throws std::range_error on
    // overflow.
    LZWFORGE_DLL
    unsigned long long getCodeCount() const;

    // Largest value that fits in the width
    LZWFORGE_DLL
    unsigned long long getMaxCode() const;

  private:
    size_t width;
    std::vector<unsigned long long> codes;
    unsigned long long repeat;
};

#endif // CODESEGMENT_HH
