#include <lzwforge/CodeSegment.hh>

#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFUtil.hh>

#include <limits>
#include <stdexcept>
#include <utility>

CodeSegment::CodeSegment(
    size_t width, std::vector<unsigned long long> codes, unsigned long long repeat) :
    width(width),
    codes(std::move(codes)),
    repeat(repeat)
{
    if ((width == 0) || (width > max_width)) {
        throw std::logic_error(
            "CodeSegment: invalid code width " + LFUtil::uint_to_string(width) +
            "; widths must be between 1 and " + LFUtil::uint_to_string(max_width));
    }
}

CodeSegment
CodeSegment::range(size_t width, unsigned long long first, unsigned long long last)
{
    if (first > last) {
        throw std::logic_error(
            "CodeSegment::range: first code " + LFUtil::uint_to_string(first) +
            " is after last code " + LFUtil::uint_to_string(last));
    }
    std::vector<unsigned long long> codes;
    codes.reserve(LFIntC::to_size(last - first + 1));
    for (unsigned long long i = first;; ++i) {
        codes.push_back(i);
        if (i == last) {
            break;
        }
    }
    return {width, std::move(codes)};
}

CodeSegment
CodeSegment::fromBitPattern(std::string const& pattern, unsigned long long repeat)
{
    if (pattern.empty() || (pattern.length() > max_width)) {
        throw std::logic_error(
            "CodeSegment::fromBitPattern: pattern length must be between 1 and " +
            LFUtil::uint_to_string(max_width));
    }
    unsigned long long value = 0;
    for (char ch: pattern) {
        if ((ch != '0') && (ch != '1')) {
            throw std::logic_error(
                "CodeSegment::fromBitPattern: invalid character in bit pattern " + pattern);
        }
        value = (value << 1) | ((ch == '1') ? 1 : 0);
    }
    return {pattern.length(), {value}, repeat};
}

size_t
CodeSegment::getWidth() const
{
    return width;
}

std::vector<unsigned long long> const&
CodeSegment::getCodes() const
{
    return codes;
}

unsigned long long
CodeSegment::getRepeat() const
{
    return repeat;
}

void
CodeSegment::setCode(size_t index, unsigned long long value)
{
    if (index >= codes.size()) {
        throw std::logic_error(
            "CodeSegment::setCode: index " + LFUtil::uint_to_string(index) +
            " out of range for segment with " + LFUtil::uint_to_string(codes.size()) + " codes");
    }
    codes[index] = value;
}

unsigned long long
CodeSegment::getCodeCount() const
{
    auto n = LFIntC::to_ulonglong(codes.size());
    if ((n != 0) && (repeat > std::numeric_limits<unsigned long long>::max() / n)) {
        throw std::range_error("CodeSegment: code count overflows 64 bits");
    }
    return n * repeat;
}

unsigned long long
CodeSegment::getMaxCode() const
{
    return (width == 64) ? std::numeric_limits<unsigned long long>::max() : ((1ULL << width) - 1);
}
