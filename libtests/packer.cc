#include <lzwforge/assert_test.h>

#include <lzwforge/BitstreamPacker.hh>
#include <lzwforge/CodeSegment.hh>
#include <lzwforge/LFUtil.hh>
#include <lzwforge/Pl_String.hh>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <stdlib.h>

static std::string
hex(std::vector<CodeSegment> const& segments,
    lzwforge_padding_e padding = lzwforge_pad_aligned,
    lzwforge_overflow_e overflow = lzwforge_overflow_expand)
{
    return LFUtil::hex_encode(BitstreamPacker::pack(segments, padding, overflow));
}

static void
check_size(
    std::vector<CodeSegment> const& segments,
    lzwforge_padding_e padding,
    lzwforge_overflow_e overflow = lzwforge_overflow_expand)
{
    auto packed = BitstreamPacker::pack(segments, padding, overflow);
    auto bits = BitstreamPacker::countBits(segments, overflow);
    assert(packed.size() == BitstreamPacker::packedSize(bits, padding));
    assert(packed.size() * 8 >= bits);
    if (padding == lzwforge_pad_aligned) {
        assert(packed.size() * 8 - bits < 8);
    } else {
        assert(packed.size() * 8 - bits >= 1);
        assert(packed.size() * 8 - bits <= 8);
    }
}

static void
test_code_segment()
{
    auto r = CodeSegment::range(9, 256, 511);
    assert(r.getWidth() == 9);
    assert(r.getCodes().size() == 256);
    assert(r.getCodes().front() == 256);
    assert(r.getCodes().back() == 511);
    assert(r.getRepeat() == 1);
    assert(r.getCodeCount() == 256);
    assert(r.getMaxCode() == 511);
    r.setCode(1, 0xFF);
    assert(r.getCodes().at(1) == 0xFF);

    auto single = CodeSegment::range(12, 4095, 4095);
    assert(single.getCodes().size() == 1);

    auto f = CodeSegment::fromBitPattern("111111111111", 273679);
    assert(f.getWidth() == 12);
    assert(f.getCodes().size() == 1);
    assert(f.getCodes().at(0) == 4095);
    assert(f.getCodeCount() == 273679);
    assert(CodeSegment::fromBitPattern("0101", 1).getCodes().at(0) == 5);

    CodeSegment wide(64, {1});
    assert(wide.getMaxCode() == std::numeric_limits<unsigned long long>::max());

    auto expect_logic_error = [](char const* what, void (*fn)()) {
        try {
            fn();
            std::cout << what << ": no exception" << std::endl;
            assert(false);
        } catch (std::logic_error& e) {
            std::cout << what << ": " << e.what() << std::endl;
        }
    };
    expect_logic_error("width 0", []() { CodeSegment(0, {}); });
    expect_logic_error("width 65", []() { CodeSegment(65, {}); });
    expect_logic_error("reversed range", []() { CodeSegment::range(9, 5, 4); });
    expect_logic_error("empty pattern", []() { CodeSegment::fromBitPattern("", 1); });
    expect_logic_error("bad pattern", []() { CodeSegment::fromBitPattern("1021", 1); });
    expect_logic_error(
        "long pattern", []() { CodeSegment::fromBitPattern(std::string(65, '1'), 1); });
    expect_logic_error("setCode", []() { CodeSegment(9, {1, 2}).setCode(2, 3); });

    bool thrown = false;
    try {
        CodeSegment(9, {1, 2}, std::numeric_limits<unsigned long long>::max()).getCodeCount();
    } catch (std::range_error& e) {
        std::cout << "code count: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
}

static void
test_layout()
{
    // A single 9-bit code with seven bits of padding
    assert(hex({{9, {256}}}) == "8000");
    assert(hex({{9, {256}}}, lzwforge_pad_always) == "8000");

    // An aligned stream only gets padding when asked for it.
    assert(hex({{8, {0xAB}}}) == "ab");
    assert(hex({{8, {0xAB}}}, lzwforge_pad_always) == "ab00");
    assert(hex({}) == "");
    assert(hex({}, lzwforge_pad_always) == "00");

    // Empty segments contribute nothing.
    assert(hex({{9, {}}, {9, {256}}, {12, {4095}, 0}}) == "8000");

    // 256 as 100000000, 255 as 011111111, 258 as 100000010
    assert(hex({{9, {256, 255, 258}}}) == "803fe040");

    // Codes straddle byte boundaries most significant bit first.
    assert(hex({{12, {0xABC, 0xDEF}}}) == "abcdef");
    assert(hex({{4, {0xA}}, {12, {0xBCD}}, {8, {0xEF}}}) == "abcdef");
    assert(hex({{12, {4095}, 3}}) == "fffffffff0");
    assert(hex({{64, {0xF51565791289754BULL}}}) == "f51565791289754b");

    check_size({{9, {256}}}, lzwforge_pad_aligned);
    check_size({{9, {256}}}, lzwforge_pad_always);
    check_size({{8, {1, 2}}}, lzwforge_pad_aligned);
    check_size({{8, {1, 2}}}, lzwforge_pad_always);
    check_size({CodeSegment::range(10, 512, 1023), {12, {4095}, 7}}, lzwforge_pad_aligned);
    check_size({CodeSegment::range(10, 512, 1023), {12, {4095}, 7}}, lzwforge_pad_always);
    check_size({{9, {512, 1}}}, lzwforge_pad_always, lzwforge_overflow_expand);
    check_size({{9, {512, 1}}}, lzwforge_pad_aligned, lzwforge_overflow_truncate);
}

static void
test_overflow()
{
    assert(BitstreamPacker::bitLength(0) == 0);
    assert(BitstreamPacker::bitLength(1) == 1);
    assert(BitstreamPacker::bitLength(255) == 8);
    assert(BitstreamPacker::bitLength(256) == 9);
    assert(BitstreamPacker::bitLength(std::numeric_limits<unsigned long long>::max()) == 64);
    assert(BitstreamPacker::codeBits(512, 9, lzwforge_overflow_expand) == 10);
    assert(BitstreamPacker::codeBits(511, 9, lzwforge_overflow_expand) == 9);
    assert(BitstreamPacker::codeBits(512, 9, lzwforge_overflow_truncate) == 9);
    assert(BitstreamPacker::codeBits(512, 9, lzwforge_overflow_strict) == 9);

    // 512 doesn't fit in 9 bits.
    assert(hex({{9, {512}}}, lzwforge_pad_aligned, lzwforge_overflow_expand) == "8000");
    assert(BitstreamPacker::countBits({{9, {512}}}, lzwforge_overflow_expand) == 10);
    assert(hex({{9, {513, 511}}}, lzwforge_pad_aligned, lzwforge_overflow_truncate) == "00ffc0");
    assert(BitstreamPacker::countBits({{9, {513, 511}}}, lzwforge_overflow_truncate) == 18);

    // Strict mode matches expand mode when everything fits.
    std::vector<CodeSegment> fits{{9, {256, 255, 258}}, CodeSegment::range(10, 512, 1023)};
    assert(
        BitstreamPacker::pack(fits, lzwforge_pad_aligned, lzwforge_overflow_strict) ==
        BitstreamPacker::pack(fits, lzwforge_pad_aligned, lzwforge_overflow_expand));

    // Strict mode rejects a segment before writing any of it.
    std::string out;
    Pl_String pl("out", nullptr, out);
    BitstreamPacker packer(&pl, lzwforge_pad_aligned, lzwforge_overflow_strict);
    packer.writeSegment({9, {1}});
    bool thrown = false;
    try {
        packer.writeSegment({9, {3, 700, 4}});
    } catch (CodeWidthOverflow& e) {
        std::cout << "strict: " << e.what() << std::endl;
        assert(e.getCode() == 700);
        assert(e.getWidth() == 9);
        assert(e.getSegmentIndex() == 1);
        assert(e.getCodeIndex() == 1);
        assert(std::string(e.what()).find("1010111100") != std::string::npos);
        thrown = true;
    }
    assert(thrown);
    assert(packer.getCodeBits() == 9);
    assert(packer.getCodeCount() == 1);

    thrown = false;
    try {
        BitstreamPacker::pack({{8, {256}}}, lzwforge_pad_aligned, lzwforge_overflow_strict);
    } catch (std::runtime_error& e) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        BitstreamPacker::countBits(
            {{64, {1}, std::numeric_limits<unsigned long long>::max()}}, lzwforge_overflow_expand);
    } catch (std::range_error& e) {
        std::cout << "countBits: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
}

static void
test_packer()
{
    std::string out;
    Pl_String pl("out", nullptr, out);
    BitstreamPacker packer(&pl, lzwforge_pad_always);
    packer.writeSegments({{9, {256, 255}}, {12, {4095}, 2}});
    assert(packer.getCodeBits() == 42);
    assert(packer.getCodeCount() == 4);
    assert(packer.getPaddingBits() == 0);
    packer.finish();
    assert(packer.getPaddingBits() == 6);
    assert(LFUtil::hex_encode(out) == "803fffffffc0");

    bool thrown = false;
    try {
        packer.writeSegment({9, {1}});
    } catch (std::logic_error& e) {
        std::cout << "after finish: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
    thrown = false;
    try {
        packer.finish();
    } catch (std::logic_error& e) {
        std::cout << "finish twice: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);

    // Padding an aligned stream adds a whole byte.
    out.clear();
    BitstreamPacker aligned(&pl, lzwforge_pad_always);
    aligned.writeSegment({16, {0x1234}});
    aligned.finish();
    assert(aligned.getPaddingBits() == 8);
    assert(LFUtil::hex_encode(out) == "123400");

    thrown = false;
    try {
        BitstreamPacker(nullptr);
    } catch (std::logic_error& e) {
        thrown = true;
    }
    assert(thrown);

    // Packing is deterministic.
    std::vector<CodeSegment> segments{
        CodeSegment::range(9, 256, 511), CodeSegment::range(11, 1024, 2047), {12, {4095}, 100}};
    assert(BitstreamPacker::pack(segments) == BitstreamPacker::pack(segments));
}

int
main()
{
    try {
        test_code_segment();
        test_layout();
        test_overflow();
        test_packer();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        exit(2);
    }
    std::cout << "done" << std::endl;
    return 0;
}
