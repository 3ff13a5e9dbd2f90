#include <lzwforge/BitstreamPacker.hh>

#include <lzwforge/BitWriter.hh>
#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFTC.hh>
#include <lzwforge/LFUtil.hh>
#include <lzwforge/Pipeline.hh>
#include <lzwforge/Pl_String.hh>

#include <algorithm>
#include <limits>

CodeWidthOverflow::CodeWidthOverflow(
    unsigned long long code, size_t width, size_t segment_index, size_t code_index) :
    std::runtime_error(
        "code " + LFUtil::uint_to_string(code) + " (binary " +
        LFUtil::uint_to_string_base(code, 2) + ") does not fit in " +
        LFUtil::uint_to_string(width) + " bits at segment " +
        LFUtil::uint_to_string(segment_index) + ", code " + LFUtil::uint_to_string(code_index)),
    code(code),
    width(width),
    segment_index(segment_index),
    code_index(code_index)
{
}

unsigned long long
CodeWidthOverflow::getCode() const
{
    return code;
}

size_t
CodeWidthOverflow::getWidth() const
{
    return width;
}

size_t
CodeWidthOverflow::getSegmentIndex() const
{
    return segment_index;
}

size_t
CodeWidthOverflow::getCodeIndex() const
{
    return code_index;
}

class BitstreamPacker::Members
{
    friend class BitstreamPacker;

  public:
    Members(Pipeline* next, lzwforge_padding_e padding, lzwforge_overflow_e overflow) :
        next(next),
        writer(next),
        padding(padding),
        overflow(overflow)
    {
    }
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    Pipeline* next;
    BitWriter writer;
    lzwforge_padding_e padding;
    lzwforge_overflow_e overflow;
    size_t segment_index{0};
    unsigned long long code_bits{0};
    unsigned long long code_count{0};
    size_t padding_bits{0};
    bool finished{false};
};

BitstreamPacker::BitstreamPacker(
    Pipeline* next, lzwforge_padding_e padding, lzwforge_overflow_e overflow) :
    m(new Members(next, padding, overflow))
{
    if (!next) {
        throw std::logic_error("Attempt to create BitstreamPacker with nullptr as next");
    }
}

BitstreamPacker::~BitstreamPacker() = default;

size_t
BitstreamPacker::bitLength(unsigned long long value)
{
    size_t result = 0;
    while (value) {
        ++result;
        value >>= 1;
    }
    return result;
}

size_t
BitstreamPacker::codeBits(unsigned long long code, size_t width, lzwforge_overflow_e overflow)
{
    if (overflow == lzwforge_overflow_expand) {
        return std::max(width, bitLength(code));
    }
    return width;
}

unsigned long long
BitstreamPacker::countBits(std::vector<CodeSegment> const& segments, lzwforge_overflow_e overflow)
{
    static auto const max_bits = std::numeric_limits<unsigned long long>::max();
    unsigned long long total = 0;
    for (auto const& segment: segments) {
        unsigned long long per_pass = 0;
        for (auto code: segment.getCodes()) {
            per_pass += codeBits(code, segment.getWidth(), overflow);
        }
        auto repeat = segment.getRepeat();
        if ((per_pass != 0) && (repeat > (max_bits - total) / per_pass)) {
            throw std::range_error("BitstreamPacker: bit count overflows 64 bits");
        }
        total += per_pass * repeat;
    }
    return total;
}

unsigned long long
BitstreamPacker::packedSize(unsigned long long code_bits, lzwforge_padding_e padding)
{
    if (padding == lzwforge_pad_always) {
        return code_bits / 8 + 1;
    }
    return code_bits / 8 + ((code_bits % 8) ? 1 : 0);
}

void
BitstreamPacker::checkSegment(CodeSegment const& segment)
{
    if (m->overflow != lzwforge_overflow_strict) {
        return;
    }
    auto max_code = segment.getMaxCode();
    auto const& codes = segment.getCodes();
    for (size_t i = 0; i < codes.size(); ++i) {
        if (codes[i] > max_code) {
            LFTC::TC("lzwforge", "BitstreamPacker strict overflow");
            throw CodeWidthOverflow(codes[i], segment.getWidth(), m->segment_index, i);
        }
    }
}

void
BitstreamPacker::writeSegment(CodeSegment const& segment)
{
    if (m->finished) {
        throw std::logic_error("BitstreamPacker: writeSegment called after finish");
    }
    checkSegment(segment);

    auto const& codes = segment.getCodes();
    auto width = segment.getWidth();
    auto max_code = segment.getMaxCode();
    if (codes.empty() || (segment.getRepeat() == 0)) {
        LFTC::TC("lzwforge", "BitstreamPacker empty segment");
    }
    for (unsigned long long pass = 0; pass < segment.getRepeat(); ++pass) {
        for (auto code: codes) {
            size_t bits = width;
            if ((code > max_code) && (m->overflow == lzwforge_overflow_expand)) {
                LFTC::TC("lzwforge", "BitstreamPacker expand overflow");
                bits = bitLength(code);
            } else if (code > max_code) {
                LFTC::TC("lzwforge", "BitstreamPacker truncate overflow");
            }
            // The writer keeps only the low-order bits, which is what truncate means.
            m->writer.writeBits(code, bits);
            m->code_bits += bits;
            ++m->code_count;
        }
    }
    ++m->segment_index;
}

void
BitstreamPacker::writeSegments(std::vector<CodeSegment> const& segments)
{
    for (auto const& segment: segments) {
        writeSegment(segment);
    }
}

void
BitstreamPacker::finish()
{
    if (m->finished) {
        throw std::logic_error("BitstreamPacker: finish called more than once");
    }
    m->finished = true;
    bool always = (m->padding == lzwforge_pad_always);
    if (always && (m->writer.pendingBits() == 0)) {
        LFTC::TC("lzwforge", "BitstreamPacker pad aligned stream");
    }
    m->padding_bits = m->writer.flush(always);
    m->next->finish();
}

unsigned long long
BitstreamPacker::getCodeBits() const
{
    return m->code_bits;
}

unsigned long long
BitstreamPacker::getCodeCount() const
{
    return m->code_count;
}

size_t
BitstreamPacker::getPaddingBits() const
{
    return m->padding_bits;
}

std::string
BitstreamPacker::pack(
    std::vector<CodeSegment> const& segments,
    lzwforge_padding_e padding,
    lzwforge_overflow_e overflow)
{
    std::string result;
    Pl_String out("packed", nullptr, result);
    BitstreamPacker packer(&out, padding, overflow);
    packer.writeSegments(segments);
    packer.finish();
    return result;
}
