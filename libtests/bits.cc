#include <lzwforge/assert_test.h>

#include <lzwforge/BitStream.hh>
#include <lzwforge/BitWriter.hh>
#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFUtil.hh>
#include <lzwforge/Pl_String.hh>
#include <iostream>
#include <stdlib.h>

// See comments in bits_functions.hh
#define BITS_TESTING 1
#define BITS_READ 1
#define BITS_WRITE 1
#include <lzwforge/bits_functions.hh>

// 11110101 00010101 01100101 01111001 00010010 10001001 01110101 01001011
// F5 15 65 79 12 89 75 4B
static unsigned char const buf[] = {0xF5, 0x15, 0x65, 0x79, 0x12, 0x89, 0x75, 0x4B};

static void
print_values(long long byte_offset, size_t bit_offset, size_t bits_available)
{
    std::cout << "byte offset = " << byte_offset << ", "
              << "bit offset = " << bit_offset << ", "
              << "bits available = " << bits_available << std::endl;
}

static unsigned long long
test_read_bits(
    unsigned char const*& p, size_t& bit_offset, size_t& bits_available, size_t bits_wanted)
{
    auto result = read_bits(p, bit_offset, bits_available, bits_wanted);
    std::cout << "bits read: " << bits_wanted << ", result = " << result << std::endl;
    print_values(p - buf, bit_offset, bits_available);
    return result;
}

static void
test_write_bits(
    unsigned char& ch, size_t& bit_offset, unsigned long long val, size_t bits, Pipeline* p)
{
    write_bits(ch, bit_offset, val, bits, p);
    std::cout << "ch = " << LFUtil::uint_to_string_base(ch, 16, 2)
              << ", bit_offset = " << bit_offset << std::endl;
}

static std::string
take(std::string& s)
{
    std::string result;
    result.swap(s);
    std::cout << "buffer: " << LFUtil::hex_encode(result) << std::endl;
    return result;
}

static std::string
bytes(unsigned char const* p, size_t n)
{
    return {reinterpret_cast<char const*>(p), n};
}

static void
test_read()
{
    unsigned char const* p = buf;
    size_t bit_offset = 7;
    size_t bits_available = 64;

    // 11110:101 0:001010:1 01100101: 01111001
    // 0:00:1:0010 10001001 01110101 01001:011
    print_values(p - buf, bit_offset, bits_available);
    assert(test_read_bits(p, bit_offset, bits_available, 5) == 30);
    assert(test_read_bits(p, bit_offset, bits_available, 4) == 10);
    assert(test_read_bits(p, bit_offset, bits_available, 6) == 10);
    assert(test_read_bits(p, bit_offset, bits_available, 9) == 357);
    assert(test_read_bits(p, bit_offset, bits_available, 9) == 242);
    assert(test_read_bits(p, bit_offset, bits_available, 2) == 0);
    assert(test_read_bits(p, bit_offset, bits_available, 1) == 1);
    assert(test_read_bits(p, bit_offset, bits_available, 0) == 0);
    assert(test_read_bits(p, bit_offset, bits_available, 25) == 5320361);
    assert(bits_available == 3);

    bool thrown = false;
    try {
        test_read_bits(p, bit_offset, bits_available, 4);
    } catch (std::runtime_error& e) {
        std::cout << "exception: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
    // A failed read leaves the position alone.
    assert(bits_available == 3);
    assert(test_read_bits(p, bit_offset, bits_available, 3) == 3);
    assert(bits_available == 0);
    assert(p == buf + 8);

    p = buf;
    bit_offset = 7;
    bits_available = 64;
    assert(test_read_bits(p, bit_offset, bits_available, 32) == 4111820153ULL);
    assert(test_read_bits(p, bit_offset, bits_available, 32) == 310998347ULL);

    p = buf;
    bit_offset = 7;
    bits_available = 64;
    assert(test_read_bits(p, bit_offset, bits_available, 64) == 0xF51565791289754BULL);

    // 64 bits starting in the middle of a byte
    p = buf;
    bit_offset = 7;
    bits_available = 64;
    assert(test_read_bits(p, bit_offset, bits_available, 4) == 0xF);
    bits_available = 68;
    thrown = false;
    try {
        read_bits(p, bit_offset, bits_available, 65);
    } catch (std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    bits_available = 60;
    assert(test_read_bits(p, bit_offset, bits_available, 60) == 0x51565791289754BULL);
}

static void
test_bit_stream()
{
    BitStream b(buf, 8);
    assert(b.bitsAvailable() == 64);
    assert(b.getBits(32) == 4111820153ULL);
    b.reset();
    assert(b.getBits(32) == 4111820153ULL);
    assert(b.getBits(32) == 310998347ULL);
    assert(b.bitsAvailable() == 0);

    b.reset();
    assert(b.getBits(6) == 61);
    b.skipToNextByte();
    assert(b.getBits(8) == 0x15);
    b.skipToNextByte();
    assert(b.getBits(8) == 0x65);
    assert(b.bitsAvailable() == 40);

    b.reset();
    assert(b.getBits(64) == 0xF51565791289754BULL);
    bool thrown = false;
    try {
        b.getBits(1);
    } catch (std::runtime_error& e) {
        std::cout << "exception: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
}

static void
test_write()
{
    std::string out;
    Pl_String pl("buffer", nullptr, out);

    // 11110:101 0:001010:1 01100101: 01111001
    // 0:00:1:0010 10001001 01110101 01001:011

    unsigned char ch = 0;
    size_t bit_offset = 7;

    test_write_bits(ch, bit_offset, 30ULL, 5, &pl);
    test_write_bits(ch, bit_offset, 10ULL, 4, &pl);
    test_write_bits(ch, bit_offset, 10ULL, 6, &pl);
    test_write_bits(ch, bit_offset, 16059ULL, 0, &pl);
    test_write_bits(ch, bit_offset, 357ULL, 9, &pl);
    assert(take(out) == bytes(buf, 3));

    test_write_bits(ch, bit_offset, 242ULL, 9, &pl);
    test_write_bits(ch, bit_offset, 0ULL, 2, &pl);
    test_write_bits(ch, bit_offset, 1ULL, 1, &pl);
    test_write_bits(ch, bit_offset, 5320361ULL, 25, &pl);
    test_write_bits(ch, bit_offset, 3ULL, 3, &pl);
    assert(take(out) == bytes(buf + 3, 5));

    test_write_bits(ch, bit_offset, 4111820153ULL, 32, &pl);
    test_write_bits(ch, bit_offset, 310998347ULL, 32, &pl);
    assert(take(out) == bytes(buf, 8));

    test_write_bits(ch, bit_offset, 0xF51565791289754BULL, 64, &pl);
    assert(take(out) == bytes(buf, 8));

    // Bits above the requested width are dropped.
    test_write_bits(ch, bit_offset, 0xFF0ULL, 4, &pl);
    test_write_bits(ch, bit_offset, 0xAFULL, 4, &pl);
    assert(take(out) == "\x0f");

    bool thrown = false;
    try {
        write_bits(ch, bit_offset, 0, 65, &pl);
    } catch (std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    assert(out.empty());
}

static void
test_bit_writer()
{
    std::string out;
    Pl_String pl("buffer", nullptr, out);

    BitWriter bw(&pl);
    assert(bw.pendingBits() == 0);
    bw.writeBits(30ULL, 5);
    assert(bw.pendingBits() == 3);
    assert(bw.flush() == 3);
    assert(bw.pendingBits() == 0);
    assert(bw.flush() == 0);
    bw.writeBits(0xAB, 8);
    assert(bw.flush() == 0);
    assert(bw.getBitsWritten() == 16);
    assert(take(out) == "\xf0\xab");

    // Forced padding on an aligned stream is a whole byte.
    assert(bw.flush(true) == 8);
    assert(bw.getBitsWritten() == 24);
    bw.writeBits(5, 3);
    assert(bw.flush(true) == 5);
    assert(take(out) == std::string("\0\xa0", 2));

    // A 64-bit value that straddles nine bytes
    bw.writeBits(1, 1);
    bw.writeBits(0xFFFFFFFFFFFFFFFFULL, 64);
    assert(bw.pendingBits() == 7);
    bw.flush();
    assert(take(out) == std::string(8, '\xff') + "\x80");

    // 9-bit codes 256 and 255 followed by 12-bit all ones
    bw.writeBits(256, 9);
    bw.writeBits(255, 9);
    bw.writeBits(0xFFF, 12);
    bw.flush();
    assert(LFUtil::hex_encode(take(out)) == "803ffffc");
}

static void
test()
{
    test_read();
    test_bit_stream();
    test_write();
    test_bit_writer();
}

int
main()
{
    try {
        test();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        exit(2);
    }
    std::cout << "done" << std::endl;
    return 0;
}
