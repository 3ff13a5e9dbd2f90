#include <lzwforge/BitWriter.hh>

// See comments in bits_functions.hh
#define BITS_WRITE 1
#include <lzwforge/bits_functions.hh>

BitWriter::BitWriter(Pipeline* pl) :
    pl(pl)
{
}

void
BitWriter::writeBits(unsigned long long val, size_t bits)
{
    write_bits(this->ch, this->bit_offset, val, bits, this->pl);
    this->bits_written += bits;
}

unsigned long long
BitWriter::getBitsWritten() const
{
    return this->bits_written;
}

size_t
BitWriter::pendingBits() const
{
    auto used = static_cast<size_t>(this->bits_written % 8);
    return used ? 8 - used : 0;
}

size_t
BitWriter::flush(bool always)
{
    size_t padding = pendingBits();
    if ((padding == 0) && always) {
        padding = 8;
    }
    if (padding > 0) {
        writeBits(0, padding);
    }
    return padding;
}
