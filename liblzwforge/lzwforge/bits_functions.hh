#ifndef BITS_FUNCTIONS_HH
#define BITS_FUNCTIONS_HH

#include <lzwforge/LFTC.hh>
#include <lzwforge/LFUtil.hh>
#include <lzwforge/Pipeline.hh>

#include <algorithm>
#include <stdexcept>

// This file is #included by specific source files, which must define BITS_READ and/or BITS_WRITE
// to get the corresponding function. These functions run once per code, hundreds of thousands of
// times for a single fixture, so the test coverage cases are conditional upon BITS_TESTING. Library
// code includes this file without BITS_TESTING, and libtests/bits.cc, which fully exercises this
// code, includes it with the symbol defined.
//
// Bits are numbered 76543210 within each byte, and bit_offset is the number of the next bit to be
// read or written in the current byte. A code is always moved most significant bit first, so a
// sequence of codes of any widths forms one contiguous MSB-first bitstream.

#ifdef BITS_READ
static unsigned long long
read_bits(
    unsigned char const*& p, size_t& bit_offset, size_t& bits_available, size_t bits_wanted)
{
    if (bits_wanted > bits_available) {
        throw std::runtime_error(
            "overflow reading bit stream: wanted = " + LFUtil::uint_to_string(bits_wanted) +
            "; available = " + LFUtil::uint_to_string(bits_available));
    }
    if (bits_wanted > 64) {
        throw std::out_of_range("read_bits: too many bits requested");
    }

    unsigned long long result = 0;
# ifdef BITS_TESTING
    if (bits_wanted == 0) {
        LFTC::TC("libtests", "bits zero bits wanted");
    }
# endif
    while (bits_wanted > 0) {
        // Grab bits from the first byte clearing anything before bit_offset.
        auto byte = static_cast<unsigned char>(*p & ((1U << (bit_offset + 1U)) - 1U));

        // There are bit_offset + 1 bits available in the first byte.
        size_t to_copy = std::min(bits_wanted, bit_offset + 1);
        size_t leftover = (bit_offset + 1) - to_copy;

# ifdef BITS_TESTING
        LFTC::TC(
            "libtests",
            "bits bit_offset",
            ((bit_offset == 0)       ? 0
                 : (bit_offset == 7) ? 1
                                     : 2));
        LFTC::TC("libtests", "bits leftover", (leftover > 0) ? 1 : 0);
# endif

        // Right shift so that all the bits we want are right justified, then append them.
        byte = static_cast<unsigned char>(byte >> leftover);
        result <<= to_copy;
        result |= byte;

        if (leftover) {
            bit_offset = leftover - 1;
        } else {
            bit_offset = 7;
            ++p;
        }
        bits_wanted -= to_copy;
        bits_available -= to_copy;
    }

    return result;
}
#endif

#ifdef BITS_WRITE
// Write the low-order `bits` bits of val. Higher-order bits of val are ignored.
static void
write_bits(
    unsigned char& ch, size_t& bit_offset, unsigned long long val, size_t bits, Pipeline* pipeline)
{
    if (bits > 64) {
        throw std::out_of_range("write_bits: too many bits requested");
    }

# ifdef BITS_TESTING
    if (bits == 0) {
        LFTC::TC("libtests", "bits write zero bits");
    }
# endif
    while (bits > 0) {
        // bit_offset + 1 is the number of bits left in ch
        size_t bits_to_write = std::min(bits, bit_offset + 1);
        auto newval = static_cast<unsigned char>(
            (val >> (bits - bits_to_write)) & ((1U << bits_to_write) - 1));
        size_t bits_left_in_ch = bit_offset + 1 - bits_to_write;
        newval = static_cast<unsigned char>(newval << bits_left_in_ch);
        ch |= newval;
        if (bits_left_in_ch == 0) {
# ifdef BITS_TESTING
            LFTC::TC("libtests", "bits write pipeline");
# endif
            pipeline->write(&ch, 1);
            bit_offset = 7;
            ch = 0;
        } else {
# ifdef BITS_TESTING
            LFTC::TC("libtests", "bits write leftover");
# endif
            bit_offset -= bits_to_write;
        }
        bits -= bits_to_write;
    }
}
#endif

#endif // BITS_FUNCTIONS_HH
