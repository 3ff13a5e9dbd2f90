#include <lzwforge/CodeReader.hh>

#include <lzwforge/BitStream.hh>
#include <lzwforge/BitstreamPacker.hh>
#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFTC.hh>
#include <lzwforge/LFUtil.hh>

#include <algorithm>
#include <stdexcept>

class CodeReader::Members
{
    friend class CodeReader;

  public:
    Members(unsigned char const* data, size_t nbytes) :
        stream(data, nbytes)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    BitStream stream;
};

CodeReader::CodeReader(unsigned char const* data, size_t nbytes) :
    m(new Members(data, nbytes))
{
}

CodeReader::CodeReader(std::string const& data) :
    m(new Members(reinterpret_cast<unsigned char const*>(data.data()), data.size()))
{
}

CodeReader::~CodeReader() = default;

unsigned long long
CodeReader::readCode(size_t width)
{
    if ((width == 0) || (width > CodeSegment::max_width)) {
        throw std::logic_error(
            "CodeReader: invalid code width " + LFUtil::uint_to_string(width));
    }
    return m->stream.getBits(width);
}

std::vector<unsigned long long>
CodeReader::readCodes(size_t width, size_t count)
{
    std::vector<unsigned long long> result;
    result.reserve(std::min(count, bitsRemaining() / std::max(width, size_t(1))));
    for (size_t i = 0; i < count; ++i) {
        result.push_back(readCode(width));
    }
    return result;
}

std::vector<unsigned long long>
CodeReader::readSegment(CodeSegment const& layout)
{
    return readCodes(layout.getWidth(), LFIntC::to_size(layout.getCodeCount()));
}

size_t
CodeReader::bitsRemaining() const
{
    return m->stream.bitsAvailable();
}

bool
CodeReader::remainingBitsZero() const
{
    // BitStream is a plain cursor, so a copy can be read without disturbing this reader.
    BitStream probe = m->stream;
    while (probe.bitsAvailable() > 0) {
        size_t n = std::min(probe.bitsAvailable(), size_t(64));
        if (probe.getBits(n) != 0) {
            return false;
        }
    }
    return true;
}

bool
CodeReader::verify(
    std::string const& data,
    std::vector<CodeSegment> const& segments,
    lzwforge_padding_e padding,
    lzwforge_overflow_e overflow,
    std::string& problem)
{
    auto code_bits = BitstreamPacker::countBits(segments, overflow);
    auto expected_size = BitstreamPacker::packedSize(code_bits, padding);
    if (LFIntC::to_ulonglong(data.size()) != expected_size) {
        problem = "packed size is " + LFUtil::uint_to_string(data.size()) + " bytes; expected " +
            LFUtil::uint_to_string(expected_size);
        return false;
    }

    CodeReader reader(data);
    size_t segment_index = 0;
    for (auto const& segment: segments) {
        auto const& codes = segment.getCodes();
        auto width = segment.getWidth();
        auto max_code = segment.getMaxCode();
        for (unsigned long long pass = 0; pass < segment.getRepeat(); ++pass) {
            for (size_t i = 0; i < codes.size(); ++i) {
                auto expected = codes[i];
                if ((expected > max_code) && (overflow == lzwforge_overflow_truncate)) {
                    expected &= max_code;
                }
                auto bits = BitstreamPacker::codeBits(codes[i], width, overflow);
                auto actual = reader.readCode(bits);
                if (actual != expected) {
                    LFTC::TC("lzwforge", "CodeReader verify mismatch");
                    problem = "segment " + LFUtil::uint_to_string(segment_index) + ", code " +
                        LFUtil::uint_to_string(i) + " (pass " + LFUtil::uint_to_string(pass) +
                        "): read " + LFUtil::uint_to_string(actual) + "; expected " +
                        LFUtil::uint_to_string(expected);
                    return false;
                }
            }
        }
        ++segment_index;
    }
    if (!reader.remainingBitsZero()) {
        problem = "padding bits are not all zero";
        return false;
    }
    return true;
}
