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

#ifndef MALICIOUSFIXTURE_HH
#define MALICIOUSFIXTURE_HH

#include <lzwforge/CodeSegment.hh>
#include <lzwforge/Constants.h>
#include <lzwforge/DLL.h>

#include <memory>
#include <string>
#include <vector>

class Pipeline;

// Builds the adversarial LZW test vector. The stream walks code widths 9 through 12 over their
// natural code ranges, so a decoder's width transitions are exercised at exactly the points a
// conforming encoder would change width, then repeats the all-ones 12-bit code enough times to push
// a decoder that doesn't cap its output past 1 GiB. One low code is injected near the start of the
// 9-bit segment:
//
//   A: width  9, codes  256..511, code at injected_index replaced by injected_code
//   B: width 10, codes  512..1023
//   C: width 11, codes 1024..2047
//   D: width 12, codes 2048..4095
//   E: width 12, bit pattern 111111111111 repeated filler_count times
//
// filler_count defaults to limit - filler_start.
class MaliciousFixture
{
  public:
    // Sizes the filler segment so that a naive decoder's output exceeds 1 GiB.
    static constexpr unsigned long long default_limit = 277775;
    // Filler codes notionally continue numbering after segment D.
    static constexpr unsigned long long filler_start = 4096;
    static constexpr unsigned long long default_injected_code = 0xFF;
    static constexpr size_t default_injected_index = 1;

    LZWFORGE_DLL
    MaliciousFixture();
    LZWFORGE_DLL
    ~MaliciousFixture();

    LZWFORGE_DLL
    void setLimit(unsigned long long);
    // Override the number of filler repetitions instead of deriving it from the limit.
    LZWFORGE_DLL
    void setFillerCount(unsigned long long);
    LZWFORGE_DLL
    void setInjectedCode(unsigned long long);
    LZWFORGE_DLL
    void setInjectedIndex(size_t);
    LZWFORGE_DLL
    void setPadding(lzwforge_padding_e);
    LZWFORGE_DLL
    void setOverflow(lzwforge_overflow_e);

    // Reproduce the historical generator byte for byte: always pad, and repeat the filler
    // limit - 1 times, since that generator's filler loop started counting at 1 rather than at
    // filler_start. With the default limit, this produces 422070 bytes. The filler count follows
    // later calls to setLimit. A later setFillerCount or setPadding overrides it.
    LZWFORGE_DLL
    void setReferenceCompatibility();
    LZWFORGE_DLL
    bool getReferenceCompatibility() const;

    LZWFORGE_DLL
    unsigned long long getLimit() const;
    // The effective filler count. Throws std::logic_error if it would be derived from a limit
    // smaller than filler_start.
    LZWFORGE_DLL
    unsigned long long getFillerCount() const;
    LZWFORGE_DLL
    unsigned long long getInjectedCode() const;
    LZWFORGE_DLL
    size_t getInjectedIndex() const;
    LZWFORGE_DLL
    lzwforge_padding_e getPadding() const;
    LZWFORGE_DLL
    lzwforge_overflow_e getOverflow() const;

    // Segments A through E. Throws std::logic_error if the injected index is outside segment A.
    LZWFORGE_DLL
    std::vector<CodeSegment> getSegments() const;

    // Number of code bits, not counting padding
    LZWFORGE_DLL
    unsigned long long getBitCount() const;
    // Number of bytes write() will produce
    LZWFORGE_DLL
    unsigned long long getPackedSize() const;

    // Pack the fixture into next and finish it.
    LZWFORGE_DLL
    void write(Pipeline* next) const;
    LZWFORGE_DLL
    std::string getData() const;

  private:
    MaliciousFixture(MaliciousFixture const&) = delete;
    MaliciousFixture& operator=(MaliciousFixture const&) = delete;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // MALICIOUSFIXTURE_HH
