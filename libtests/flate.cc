#include <lzwforge/assert_test.h>

#include <lzwforge/LFUtil.hh>
#include <lzwforge/MaliciousFixture.hh>
#include <lzwforge/Pl_Count.hh>
#include <lzwforge/Pl_Flate.hh>
#include <lzwforge/Pl_StdioFile.hh>
#include <lzwforge/Pl_String.hh>

#include <cstdio>
#include <iostream>
#include <stdlib.h>

static std::string
read_file(char const* filename)
{
    LFUtil::FileCloser fc(LFUtil::safe_fopen(filename, "rb"));
    std::string result;
    char buf[1024];
    size_t len;
    while ((len = fread(buf, 1, sizeof(buf), fc.f)) > 0) {
        result.append(buf, len);
    }
    fc.close(std::string("close ") + filename);
    return result;
}

static void
run(char const* filename)
{
    MaliciousFixture fixture;
    auto raw = fixture.getData();

    // Write the compressed fixture to a file, counting compressed bytes.
    {
        LFUtil::FileCloser fc(LFUtil::safe_fopen(filename, "wb"));
        Pl_StdioFile out("out", fc.f);
        Pl_Count count("count", &out);
        Pl_Flate def("def", &count, Pl_Flate::a_deflate);
        fixture.write(&def);
        fc.close(std::string("close ") + filename);
        std::cout << "compressed " << raw.size() << " bytes to " << count.getCount() << std::endl;
        // The fixture is almost entirely one repeated code.
        assert(count.getCount() > 0);
        assert(count.getCount() < 20000);
    }

    // Read it back and inflate it.
    auto compressed = read_file(filename);
    std::string inflated;
    Pl_String s("inflated", nullptr, inflated);
    Pl_Flate inf("inf", &s, Pl_Flate::a_inflate);
    inf.write(reinterpret_cast<unsigned char const*>(compressed.data()), compressed.size());
    inf.finish();
    assert(inflated == raw);

    // Deflate and inflate in one chain at a different compression level.
    Pl_Flate::setCompressionLevel(9);
    std::string both;
    Pl_String s2("both", nullptr, both);
    Pl_Count count2("count2", &s2);
    Pl_Flate inf2("inf2", &count2, Pl_Flate::a_inflate);
    Pl_Flate def2("def2", &inf2, Pl_Flate::a_deflate);
    fixture.write(&def2);
    assert(count2.getCount() == 415927);
    assert(both == raw);

    // Truncated input is a warning, and what could be inflated is still passed on.
    std::string partial;
    Pl_String s4("partial", nullptr, partial);
    Pl_Flate inf4("inf4", &s4, Pl_Flate::a_inflate);
    int warnings = 0;
    inf4.setWarnCallback([&warnings](char const* msg, int code) {
        std::cout << "truncated: " << msg << " (" << code << ")" << std::endl;
        ++warnings;
    });
    inf4.write(
        reinterpret_cast<unsigned char const*>(compressed.data()), compressed.size() / 2);
    inf4.finish();
    assert(warnings > 0);
    assert(partial.size() < raw.size());
    assert(raw.compare(0, partial.size(), partial) == 0);

    // Corrupt input is reported as an error.
    std::string garbage;
    Pl_String s3("garbage", nullptr, garbage);
    Pl_Flate inf3("inf3", &s3, Pl_Flate::a_inflate);
    bool thrown = false;
    try {
        inf3.write(reinterpret_cast<unsigned char const*>(raw.data()), 64);
        inf3.finish();
    } catch (std::runtime_error& e) {
        std::cout << "inflate garbage: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);

    remove(filename);
}

int
main(int argc, char* argv[])
{
    char const* filename = (argc == 2) ? argv[1] : "flate.out";
    try {
        run(filename);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        exit(2);
    }
    std::cout << "done" << std::endl;
    return 0;
}
