#include <lzwforge/assert_test.h>

#include <lzwforge/BitstreamPacker.hh>
#include <lzwforge/CodeReader.hh>
#include <lzwforge/LFUtil.hh>
#include <lzwforge/MaliciousFixture.hh>
#include <lzwforge/Pl_Count.hh>
#include <lzwforge/Pl_String.hh>
#include <iostream>
#include <stdexcept>
#include <stdlib.h>

static std::string
hex_at(std::string const& data, size_t offset, size_t len)
{
    return LFUtil::hex_encode(data.substr(offset, len));
}

static void
test_defaults()
{
    MaliciousFixture f;
    assert(f.getLimit() == 277775);
    assert(f.getFillerCount() == 273679);
    assert(f.getInjectedCode() == 0xFF);
    assert(f.getInjectedIndex() == 1);
    assert(f.getPadding() == lzwforge_pad_aligned);
    assert(f.getOverflow() == lzwforge_overflow_expand);
    assert(!f.getReferenceCompatibility());

    auto segments = f.getSegments();
    assert(segments.size() == 5);
    size_t width = 9;
    for (size_t i = 0; i < 4; ++i, ++width) {
        auto const& s = segments.at(i);
        assert(s.getWidth() == width);
        assert(s.getRepeat() == 1);
        assert(s.getCodes().size() == (1U << (width - 1)));
        assert(s.getCodes().back() == (1U << width) - 1);
    }
    assert(segments.at(0).getCodes().at(0) == 256);
    assert(segments.at(0).getCodes().at(1) == 0xFF);
    assert(segments.at(0).getCodes().at(2) == 258);
    assert(segments.at(1).getCodes().at(0) == 512);
    assert(segments.at(4).getWidth() == 12);
    assert(segments.at(4).getCodes().size() == 1);
    assert(segments.at(4).getCodes().at(0) == 4095);
    assert(segments.at(4).getRepeat() == 273679);

    assert(f.getBitCount() == 3327412);
    assert(f.getPackedSize() == 415927);

    auto data = f.getData();
    assert(data.size() == 415927);
    // 256 as 100000000, then the injected 0xFF as 011111111, then 258 as 100000010
    assert(hex_at(data, 0, 3) == "803fe0");
    // Segment A ends on a byte boundary with 511; segment B starts with 512 and 513.
    assert(hex_at(data, 287, 3) == "ff8020");
    // The filler ends four bits into the last byte.
    assert(hex_at(data, data.size() - 3, 3) == "fffff0");

    std::string problem;
    assert(CodeReader::verify(data, segments, f.getPadding(), f.getOverflow(), problem));

    // write() and getData() agree, and the byte count matches.
    std::string written;
    Pl_String pl("fixture", nullptr, written);
    Pl_Count count("count", &pl);
    f.write(&count);
    assert(count.getCount() == 415927);
    assert(written == data);
}

static void
test_reference()
{
    MaliciousFixture f;
    f.setReferenceCompatibility();
    assert(f.getFillerCount() == 277774);
    assert(f.getPadding() == lzwforge_pad_always);
    assert(f.getBitCount() == 3376552);
    assert(f.getPackedSize() == 422070);

    auto data = f.getData();
    assert(data.size() == 422070);
    assert(hex_at(data, 0, 3) == "803fe0");
    assert(hex_at(data, data.size() - 3, 3) == "ffff00");

    std::string problem;
    assert(CodeReader::verify(data, f.getSegments(), f.getPadding(), f.getOverflow(), problem));

    // The filler count follows a limit set afterward.
    f.setLimit(4097);
    assert(f.getReferenceCompatibility());
    assert(f.getFillerCount() == 4096);
    assert(f.getBitCount() == 43264 + 4096 * 12);
    assert(f.getPackedSize() == 5408 + 6144 + 1);
    f.setLimit(1);
    assert(f.getFillerCount() == 0);
    assert(f.getPackedSize() == 5409);
    f.setLimit(0);
    bool thrown = false;
    try {
        f.getFillerCount();
    } catch (std::logic_error& e) {
        std::cout << "reference with limit later set to 0: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
    f.setLimit(MaliciousFixture::default_limit);

    // An explicit filler count set afterward wins.
    f.setFillerCount(0);
    assert(f.getBitCount() == 43264);
    assert(f.getPackedSize() == 5409);
}

static void
test_options()
{
    MaliciousFixture f;
    f.setLimit(4096);
    assert(f.getFillerCount() == 0);
    assert(f.getBitCount() == 43264);
    assert(f.getPackedSize() == 5408);
    f.setPadding(lzwforge_pad_always);
    assert(f.getData().size() == 5409);
    assert(f.getData().back() == '\0');

    f.setPadding(lzwforge_pad_aligned);
    f.setFillerCount(2);
    assert(f.getBitCount() == 43288);
    auto data = f.getData();
    assert(data.size() == 5411);
    assert(hex_at(data, 5408, 3) == "ffffff");

    // An injected code too large for 9 bits
    f.setInjectedCode(1000);
    assert(f.getBitCount() == 43289);
    f.setOverflow(lzwforge_overflow_truncate);
    assert(f.getBitCount() == 43288);
    std::string problem;
    assert(CodeReader::verify(
        f.getData(), f.getSegments(), f.getPadding(), f.getOverflow(), problem));
    f.setOverflow(lzwforge_overflow_strict);
    std::string out;
    Pl_String pl("out", nullptr, out);
    bool thrown = false;
    try {
        f.write(&pl);
    } catch (CodeWidthOverflow& e) {
        std::cout << "strict fixture: " << e.what() << std::endl;
        assert(e.getSegmentIndex() == 0);
        assert(e.getCodeIndex() == 1);
        thrown = true;
    }
    assert(thrown);
    assert(out.empty());

    f.setOverflow(lzwforge_overflow_expand);
    f.setInjectedCode(0);
    f.setInjectedIndex(255);
    assert(f.getSegments().at(0).getCodes().at(255) == 0);
    assert(f.getSegments().at(0).getCodes().at(1) == 257);
}

static void
test_errors()
{
    MaliciousFixture f;
    f.setLimit(4095);
    bool thrown = false;
    try {
        f.getFillerCount();
    } catch (std::logic_error& e) {
        std::cout << "small limit: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);

    // Nothing is written when the configuration is bad.
    std::string out;
    Pl_String pl("out", nullptr, out);
    thrown = false;
    try {
        f.write(&pl);
    } catch (std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(out.empty());

    MaliciousFixture g;
    g.setInjectedIndex(256);
    thrown = false;
    try {
        g.getSegments();
    } catch (std::logic_error& e) {
        std::cout << "bad index: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);

    MaliciousFixture h;
    h.setLimit(0);
    thrown = false;
    try {
        h.setReferenceCompatibility();
    } catch (std::logic_error& e) {
        std::cout << "reference with limit 0: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);
}

int
main()
{
    try {
        test_defaults();
        test_reference();
        test_options();
        test_errors();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        exit(2);
    }
    std::cout << "done" << std::endl;
    return 0;
}
