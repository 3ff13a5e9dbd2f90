#include <lzwforge/assert_test.h>

#include <lzwforge/BitstreamPacker.hh>
#include <lzwforge/CodeReader.hh>
#include <lzwforge/CodeSegment.hh>
#include <iostream>
#include <stdexcept>
#include <stdlib.h>

static std::vector<CodeSegment>
ladder()
{
    std::vector<CodeSegment> segments;
    for (size_t width = 9; width <= 12; ++width) {
        segments.push_back(CodeSegment::range(width, 1ULL << (width - 1), (1ULL << width) - 1));
    }
    segments.push_back(CodeSegment::fromBitPattern("111111111111", 17));
    return segments;
}

static void
test_read_back()
{
    auto segments = ladder();
    auto packed = BitstreamPacker::pack(segments);
    CodeReader reader(packed);
    for (auto const& segment: segments) {
        auto codes = reader.readSegment(segment);
        assert(codes.size() == segment.getCodeCount());
        if (segment.getRepeat() == 1) {
            assert(codes == segment.getCodes());
        } else {
            for (auto code: codes) {
                assert(code == 4095);
            }
        }
    }
    // 9 * 256 + 10 * 512 + 11 * 1024 + 12 * 2048 + 12 * 17 = 43468 bits, so four bits of padding
    assert(reader.bitsRemaining() == 4);
    assert(reader.remainingBitsZero());
    assert(reader.bitsRemaining() == 4);

    bool thrown = false;
    try {
        reader.readCode(5);
    } catch (std::runtime_error& e) {
        std::cout << "read past end: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
    assert(reader.readCode(4) == 0);
    assert(reader.bitsRemaining() == 0);
    assert(reader.remainingBitsZero());

    thrown = false;
    try {
        reader.readCode(0);
    } catch (std::logic_error& e) {
        std::cout << "width 0: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
}

static void
test_raw()
{
    unsigned char const data[] = {0x80, 0x3f, 0xe0, 0x40};
    CodeReader reader(data, sizeof(data));
    auto codes = reader.readCodes(9, 3);
    assert(codes.size() == 3);
    assert(codes.at(0) == 256);
    assert(codes.at(1) == 255);
    assert(codes.at(2) == 258);
    assert(reader.bitsRemaining() == 5);
    assert(reader.remainingBitsZero());

    unsigned char const dirty[] = {0x80, 0x01};
    CodeReader dirty_reader(dirty, sizeof(dirty));
    assert(dirty_reader.readCode(9) == 256);
    assert(!dirty_reader.remainingBitsZero());
}

static void
test_verify()
{
    auto segments = ladder();
    std::string problem;
    for (auto padding: {lzwforge_pad_aligned, lzwforge_pad_always}) {
        for (auto overflow:
             {lzwforge_overflow_expand, lzwforge_overflow_truncate, lzwforge_overflow_strict}) {
            auto packed = BitstreamPacker::pack(segments, padding, overflow);
            assert(CodeReader::verify(packed, segments, padding, overflow, problem));
        }
    }

    auto packed = BitstreamPacker::pack(segments);

    // Wrong length
    assert(!CodeReader::verify(
        packed.substr(0, packed.size() - 1),
        segments,
        lzwforge_pad_aligned,
        lzwforge_overflow_expand,
        problem));
    std::cout << "length: " << problem << std::endl;
    assert(problem.find("packed size") != std::string::npos);

    // A flipped bit in the second 10-bit code
    auto damaged = packed;
    damaged.at(289) = static_cast<char>(damaged.at(289) ^ 0x01);
    assert(!CodeReader::verify(
        damaged, segments, lzwforge_pad_aligned, lzwforge_overflow_expand, problem));
    std::cout << "damaged: " << problem << std::endl;
    assert(problem.find("segment 1") == 0);

    // Nonzero padding
    damaged = packed;
    damaged.back() = static_cast<char>(damaged.back() | 0x01);
    assert(!CodeReader::verify(
        damaged, segments, lzwforge_pad_aligned, lzwforge_overflow_expand, problem));
    std::cout << "padding: " << problem << std::endl;
    assert(problem == "padding bits are not all zero");

    // Overflowing codes are read back at the width the mode gives them.
    std::vector<CodeSegment> overflow{{9, {256, 1000, 511}}};
    auto expanded = BitstreamPacker::pack(overflow, lzwforge_pad_aligned);
    assert(expanded.size() == 4);
    assert(CodeReader::verify(
        expanded, overflow, lzwforge_pad_aligned, lzwforge_overflow_expand, problem));
    auto truncated =
        BitstreamPacker::pack(overflow, lzwforge_pad_aligned, lzwforge_overflow_truncate);
    assert(truncated.size() == 4);
    assert(CodeReader::verify(
        truncated, overflow, lzwforge_pad_aligned, lzwforge_overflow_truncate, problem));
    assert(!CodeReader::verify(
        truncated, overflow, lzwforge_pad_aligned, lzwforge_overflow_expand, problem));
}

int
main()
{
    try {
        test_read_back();
        test_raw();
        test_verify();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        exit(2);
    }
    std::cout << "done" << std::endl;
    return 0;
}
