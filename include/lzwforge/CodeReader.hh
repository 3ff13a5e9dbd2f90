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

#ifndef CODEREADER_HH
#define CODEREADER_HH

#include <lzwforge/CodeSegment.hh>
#include <lzwforge/Constants.h>
#include <lzwforge/DLL.h>

#include <memory>
#include <string>
#include <vector>

// Reads fixed-width MSB-first codes back out of a packed buffer, the way an LZW decoder's bit
// reader would, given the width schedule that produced it. This reads codes only; it does not
// interpret them or rebuild an LZW dictionary.
//
// The reader does not copy the data. The caller must keep it alive while the reader is in use.
class CodeReader
{
  public:
    LZWFORGE_DLL
    CodeReader(unsigned char const* data, size_t nbytes);
    LZWFORGE_DLL
    CodeReader(std::string const& data);
    LZWFORGE_DLL
    ~CodeReader();

    // Read one code of width bits (1 to 64). Throws std::logic_error for an invalid width and
    // std::runtime_error if fewer than width bits remain.
    LZWFORGE_DLL
    unsigned long long readCode(size_t width);
    LZWFORGE_DLL
    std::vector<unsigned long long> readCodes(size_t width, size_t count);
    // Read as many codes as layout would emit, at layout's width. The values in layout are ignored.
    LZWFORGE_DLL
    std::vector<unsigned long long> readSegment(CodeSegment const& layout);

    LZWFORGE_DLL
    size_t bitsRemaining() const;
    // True when every unread bit is zero, i.e. nothing but padding remains. Does not move the
    // read position.
    LZWFORGE_DLL
    bool remainingBitsZero() const;

    // Check that data is exactly what BitstreamPacker produces for segments with the given modes:
    // every code in order at the width the overflow mode gives it, followed by the padding the
    // padding mode calls for, all zero. On failure, returns false and describes the first
    // difference in problem.
    LZWFORGE_DLL
    static bool verify(
        std::string const& data,
        std::vector<CodeSegment> const& segments,
        lzwforge_padding_e padding,
        lzwforge_overflow_e overflow,
        std::string& problem);

  private:
    CodeReader(CodeReader const&) = delete;
    CodeReader& operator=(CodeReader const&) = delete;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // CODEREADER_HH
