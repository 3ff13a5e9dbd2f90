#include <lzwforge/assert_test.h>

#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFSystemError.hh>
#include <lzwforge/LFUtil.hh>
#include <cerrno>
#include <cstdint>
#include <iostream>
#include <stdlib.h>
#include <string.h>

static void
test_to_ull(char const* str, unsigned long long wanted, bool error)
{
    bool threw = false;
    unsigned long long result = 0;
    try {
        result = LFUtil::string_to_ull(str);
    } catch (std::runtime_error const& e) {
        threw = true;
        std::cout << str << " threw: " << e.what() << std::endl;
    }
    assert(threw == error);
    if (!error) {
        assert(result == wanted);
    }
}

static void
string_conversion_test()
{
    assert(LFUtil::uint_to_string(0) == "0");
    assert(LFUtil::uint_to_string(16059, 7) == "0016059");
    assert(LFUtil::uint_to_string(16059, -7) == "16059  ");
    assert(LFUtil::uint_to_string(18446744073709551615ULL) == "18446744073709551615");
    assert(LFUtil::uint_to_string_base(255, 16) == "ff");
    assert(LFUtil::uint_to_string_base(255, 16, 4) == "00ff");
    assert(LFUtil::uint_to_string_base(8, 8) == "10");
    assert(LFUtil::uint_to_string_base(0, 2) == "0");
    assert(LFUtil::uint_to_string_base(256, 2) == "100000000");
    assert(LFUtil::uint_to_string_base(0xFF, 2, 9) == "011111111");
    assert(LFUtil::uint_to_string_base(4095, 2, 12) == "111111111111");
    bool threw = false;
    try {
        LFUtil::uint_to_string_base(10, 3);
    } catch (std::logic_error& e) {
        threw = true;
    }
    assert(threw);

    test_to_ull("0", 0, false);
    test_to_ull("277775", 277775, false);
    test_to_ull(" 4096", 4096, false);
    test_to_ull("18446744073709551615", 18446744073709551615ULL, false);
    test_to_ull("18446744073709551616", 0, true);
    test_to_ull("-1", 0, true);
    test_to_ull(" -1", 0, true);
    test_to_ull("", 0, true);
    test_to_ull("12x", 0, true);
    test_to_ull("x12", 0, true);

    assert(LFUtil::hex_encode(std::string("\x80\x3f\xe0\x00", 4)) == "803fe000");
}

static void
intc_test()
{
    uint64_t small = 12345;
    int32_t negative = -81;

    assert(LFIntC::to_uint(small) == 12345U);
    assert(LFIntC::to_size(small) == 12345U);
    assert(LFIntC::to_offset(small) == 12345);
    assert(LFIntC::to_int(negative) == -81);
    assert(LFIntC::to_uchar(255) == 255);

    auto expect_range_error = [](char const* what, void (*fn)()) {
        bool threw = false;
        try {
            fn();
        } catch (std::range_error& e) {
            std::cout << what << ": " << e.what() << std::endl;
            threw = true;
        }
        assert(threw);
    };
    expect_range_error("to_uint(big)", []() { LFIntC::to_uint(uint64_t(1099511627776ULL)); });
    expect_range_error("to_ulonglong(negative)", []() { LFIntC::to_ulonglong(int32_t(-81)); });
    expect_range_error("to_int(uint32)", []() { LFIntC::to_int(uint32_t(3141592653U)); });
    expect_range_error("to_uchar(256)", []() { LFIntC::to_uchar(256); });
}

static void
system_error_test()
{
    try {
        LFUtil::safe_fopen("/this/file/does/not/exist", "rb");
        assert(false);
    } catch (LFSystemError& e) {
        std::cout << "system error: " << e.what() << std::endl;
        assert(e.getErrno() == ENOENT);
        assert(e.getDescription() == "open /this/file/does/not/exist");
        assert(std::string(e.what()).find(strerror(ENOENT)) != std::string::npos);
    }

    LFUtil::FileCloser fc(nullptr);
    // Closing with nothing open is a no-op.
    fc.close("close nothing");
}

static void
whoami_test()
{
    char path1[] = "/usr/local/bin/lzwforge";
    assert(strcmp(LFUtil::getWhoami(path1), "lzwforge") == 0);
    char path2[] = "C:\\tools\\lzwforge.exe";
    assert(strcmp(LFUtil::getWhoami(path2), "lzwforge") == 0);
    char path3[] = "lzwforge";
    assert(strcmp(LFUtil::getWhoami(path3), "lzwforge") == 0);

    std::string value;
    assert(!LFUtil::get_env("LZWFORGE_SURELY_UNSET_VARIABLE", &value));
}

int
main()
{
    try {
        string_conversion_test();
        intc_test();
        system_error_test();
        whoami_test();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        exit(2);
    }
    std::cout << "done" << std::endl;
    return 0;
}
