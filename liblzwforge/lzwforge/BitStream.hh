// Read bits from a bit stream. See BitWriter for writing.

#ifndef BITSTREAM_HH
#define BITSTREAM_HH

#include <cstddef>

class BitStream
{
  public:
    BitStream(unsigned char const* p, size_t nbytes);
    void reset();
    // Read nbits (0 to 64) most significant first. Throws std::runtime_error if fewer than nbits
    // remain.
    unsigned long long getBits(size_t nbits);
    void skipToNextByte();
    size_t bitsAvailable() const;

  private:
    unsigned char const* start;
    size_t nbytes;

    unsigned char const* p;
    size_t bit_offset;
    size_t bits_available;
};

#endif // BITSTREAM_HH
