// Write bits into a bit stream. See BitStream for reading.

#ifndef BITWRITER_HH
#define BITWRITER_HH

#include <cstddef>

class Pipeline;

class BitWriter
{
  public:
    // Write bits to the pipeline. It is the caller's responsibility to eventually call finish on
    // the pipeline.
    BitWriter(Pipeline* pl);
    // Write the low-order bits of val, most significant first. bits may be 0 to 64.
    void writeBits(unsigned long long val, size_t bits);
    // Total bits written so far, including any padding written by flush().
    unsigned long long getBitsWritten() const;
    // Number of bits that must be written to complete the current partial byte; 0 when the stream
    // is byte aligned.
    size_t pendingBits() const;
    // Complete any partial byte with zero bits. If always is true, an aligned stream gets a whole
    // zero byte. Returns the number of padding bits written.
    size_t flush(bool always = false);

  private:
    Pipeline* pl;
    unsigned char ch{0};
    size_t bit_offset{7};
    unsigned long long bits_written{0};
};

#endif // BITWRITER_HH
