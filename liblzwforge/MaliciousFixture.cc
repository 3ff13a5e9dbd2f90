#include <lzwforge/MaliciousFixture.hh>

#include <lzwforge/BitstreamPacker.hh>
#include <lzwforge/LFTC.hh>
#include <lzwforge/LFUtil.hh>
#include <lzwforge/Pl_String.hh>

#include <stdexcept>

namespace
{
    char const* const filler_pattern = "111111111111";
    size_t const first_width = 9;
    size_t const last_width = 12;
} // namespace

class MaliciousFixture::Members
{
    friend class MaliciousFixture;

  public:
    Members() = default;
    Members(Members const&) = delete;
    ~Members() = default;

  private:
    unsigned long long limit{MaliciousFixture::default_limit};
    bool filler_count_set{false};
    unsigned long long filler_count{0};
    bool reference{false};
    unsigned long long injected_code{MaliciousFixture::default_injected_code};
    size_t injected_index{MaliciousFixture::default_injected_index};
    lzwforge_padding_e padding{lzwforge_pad_aligned};
    lzwforge_overflow_e overflow{lzwforge_overflow_expand};
};

MaliciousFixture::MaliciousFixture() :
    m(new Members())
{
}

MaliciousFixture::~MaliciousFixture() = default;

void
MaliciousFixture::setLimit(unsigned long long limit)
{
    m->limit = limit;
}

void
MaliciousFixture::setFillerCount(unsigned long long count)
{
    m->filler_count_set = true;
    m->filler_count = count;
}

void
MaliciousFixture::setInjectedCode(unsigned long long code)
{
    m->injected_code = code;
}

void
MaliciousFixture::setInjectedIndex(size_t index)
{
    m->injected_index = index;
}

void
MaliciousFixture::setPadding(lzwforge_padding_e padding)
{
    m->padding = padding;
}

void
MaliciousFixture::setOverflow(lzwforge_overflow_e overflow)
{
    m->overflow = overflow;
}

void
MaliciousFixture::setReferenceCompatibility()
{
    if (m->limit == 0) {
        throw std::logic_error("MaliciousFixture: reference compatibility requires a limit of at "
                               "least 1");
    }
    m->padding = lzwforge_pad_always;
    m->reference = true;
}

bool
MaliciousFixture::getReferenceCompatibility() const
{
    return m->reference;
}

unsigned long long
MaliciousFixture::getLimit() const
{
    return m->limit;
}

unsigned long long
MaliciousFixture::getFillerCount() const
{
    if (m->filler_count_set) {
        return m->filler_count;
    }
    if (m->reference) {
        if (m->limit == 0) {
            throw std::logic_error("MaliciousFixture: reference compatibility requires a limit of "
                                   "at least 1");
        }
        LFTC::TC("lzwforge", "MaliciousFixture reference filler count");
        return m->limit - 1;
    }
    if (m->limit < filler_start) {
        throw std::logic_error(
            "MaliciousFixture: limit " + LFUtil::uint_to_string(m->limit) +
            " is smaller than the first filler code " + LFUtil::uint_to_string(filler_start));
    }
    return m->limit - filler_start;
}

unsigned long long
MaliciousFixture::getInjectedCode() const
{
    return m->injected_code;
}

size_t
MaliciousFixture::getInjectedIndex() const
{
    return m->injected_index;
}

lzwforge_padding_e
MaliciousFixture::getPadding() const
{
    return m->padding;
}

lzwforge_overflow_e
MaliciousFixture::getOverflow() const
{
    return m->overflow;
}

std::vector<CodeSegment>
MaliciousFixture::getSegments() const
{
    std::vector<CodeSegment> segments;
    for (size_t width = first_width; width <= last_width; ++width) {
        segments.push_back(CodeSegment::range(width, 1ULL << (width - 1), (1ULL << width) - 1));
    }
    auto& first = segments.front();
    if (m->injected_index >= first.getCodes().size()) {
        throw std::logic_error(
            "MaliciousFixture: injected index " + LFUtil::uint_to_string(m->injected_index) +
            " is outside the " + LFUtil::uint_to_string(first.getCodes().size()) +
            "-code first segment");
    }
    if (m->injected_code > first.getMaxCode()) {
        LFTC::TC("lzwforge", "MaliciousFixture injected code overflows");
    }
    first.setCode(m->injected_index, m->injected_code);
    segments.push_back(CodeSegment::fromBitPattern(filler_pattern, getFillerCount()));
    return segments;
}

unsigned long long
MaliciousFixture::getBitCount() const
{
    return BitstreamPacker::countBits(getSegments(), m->overflow);
}

unsigned long long
MaliciousFixture::getPackedSize() const
{
    return BitstreamPacker::packedSize(getBitCount(), m->padding);
}

void
MaliciousFixture::write(Pipeline* next) const
{
    // Build the segments first so configuration errors are raised before anything is written.
    auto segments = getSegments();
    BitstreamPacker packer(next, m->padding, m->overflow);
    packer.writeSegments(segments);
    packer.finish();
}

std::string
MaliciousFixture::getData() const
{
    std::string result;
    Pl_String out("fixture", nullptr, result);
    write(&out);
    return result;
}
