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

#ifndef BITSTREAMPACKER_HH
#define BITSTREAMPACKER_HH

#include <lzwforge/CodeSegment.hh>
#include <lzwforge/Constants.h>
#include <lzwforge/DLL.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class Pipeline;

// Thrown in strict overflow mode when a code does not fit in its segment's width.
class LZWFORGE_DLL_CLASS CodeWidthOverflow: public std::runtime_error
{
  public:
    LZWFORGE_DLL
    CodeWidthOverflow(
        unsigned long long code, size_t width, size_t segment_index, size_t code_index);
    LZWFORGE_DLL
    ~CodeWidthOverflow() noexcept override = default;

    LZWFORGE_DLL
    unsigned long long getCode() const;
    LZWFORGE_DLL
    size_t getWidth() const;
    // Position of the segment among those written to the packer, starting at 0
    LZWFORGE_DLL
    size_t getSegmentIndex() const;
    // Position of the code in the segment's code list, starting at 0
    LZWFORGE_DLL
    size_t getCodeIndex() const;

  private:
    unsigned long long code;
    size_t width;
    size_t segment_index;
    size_t code_index;
};

// Packs code segments into an MSB-first LZW-style bitstream and writes the resulting bytes to a
// pipeline as they are completed. Every code of every segment is written in order at its
// segment's width, and finish() zero-pads the final byte according to the padding mode.
//
// Overflow modes (see Constants.h):
//   expand   -- a code wider than its segment is written with its full binary length. This is
//               what the historical fixture generator did, and it is the default.
//   truncate -- only the low-order width bits are written.
//   strict   -- CodeWidthOverflow is thrown before any code of the offending segment is written.
//
// Padding modes:
//   aligned  -- pad only a partial final byte; the output is ceil(bits / 8) bytes.
//   always   -- pad 8 - (bits % 8) bits, adding a whole zero byte to an aligned stream. This
//               reproduces the historical generator's output.
class BitstreamPacker
{
  public:
    // The packer does not own next. finish() finishes it.
    LZWFORGE_DLL
    BitstreamPacker(
        Pipeline* next,
        lzwforge_padding_e padding = lzwforge_pad_aligned,
        lzwforge_overflow_e overflow = lzwforge_overflow_expand);
    LZWFORGE_DLL
    ~BitstreamPacker();

    LZWFORGE_DLL
    void writeSegment(CodeSegment const&);
    LZWFORGE_DLL
    void writeSegments(std::vector<CodeSegment> const&);

    // Pad the final byte and finish the pipeline. The packer may not be used afterward.
    LZWFORGE_DLL
    void finish();

    // Number of bits written for codes, not counting padding
    LZWFORGE_DLL
    unsigned long long getCodeBits() const;
    LZWFORGE_DLL
    unsigned long long getCodeCount() const;
    // Number of zero bits added by finish(); 0 before finish() is called
    LZWFORGE_DLL
    size_t getPaddingBits() const;

    // Pack segments into a string in one step.
    LZWFORGE_DLL
    static std::string pack(
        std::vector<CodeSegment> const&,
        lzwforge_padding_e padding = lzwforge_pad_aligned,
        lzwforge_overflow_e overflow = lzwforge_overflow_expand);

    // Number of bits needed to represent value; 0 for 0.
    LZWFORGE_DLL
    static size_t bitLength(unsigned long long value);

    // Number of bits a code occupies in the stream under the given overflow mode.
    LZWFORGE_DLL
    static size_t codeBits(unsigned long long code, size_t width, lzwforge_overflow_e overflow);

    // Number of code bits segments will produce under the given overflow mode, without packing.
    LZWFORGE_DLL
    static unsigned long long
    countBits(std::vector<CodeSegment> const&, lzwforge_overflow_e overflow);

    // Number of output bytes for a stream of code_bits bits under the given padding mode.
    LZWFORGE_DLL
    static unsigned long long packedSize(unsigned long long code_bits, lzwforge_padding_e padding);

  private:
    BitstreamPacker(BitstreamPacker const&) = delete;
    BitstreamPacker& operator=(BitstreamPacker const&) = delete;

    void checkSegment(CodeSegment const&);

    class Members;

    std::unique_ptr<Members> m;
};

#endif // BITSTREAMPACKER_HH
