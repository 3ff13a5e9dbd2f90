#include <lzwforge/assert_test.h>

#include <lzwforge/LFLogger.hh>
#include <lzwforge/Pl_String.hh>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <stdlib.h>

static void
test_routing()
{
    auto l = LFLogger::create();
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
    // With no warning pipeline, warnings go wherever errors go.
    assert(l->getWarn() == l->standardError());
    assert(l->getWarn(true) == l->standardError());

    std::string info;
    std::string errors;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    l->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
    l->info("wrote fixture\n");
    l->warn(std::string("lzwforge: WARNING: first\n"));
    l->error("lzwforge: failed\n");
    assert(info == "wrote fixture\n");
    assert(errors == "lzwforge: WARNING: first\nlzwforge: failed\n");

    std::string warnings;
    l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, warnings));
    l->warn("lzwforge: WARNING: second\n");
    assert(warnings == "lzwforge: WARNING: second\n");
    assert(errors == "lzwforge: WARNING: first\nlzwforge: failed\n");

    l->setWarn(nullptr);
    l->warn("lzwforge: WARNING: third\n");
    assert(warnings == "lzwforge: WARNING: second\n");
    assert(errors == "lzwforge: WARNING: first\nlzwforge: failed\nlzwforge: WARNING: third\n");

    l->setInfo(nullptr);
    l->setError(nullptr);
    assert(l->getInfo() == l->standardOutput());
    assert(l->getError() == l->standardError());
}

static void
test_quiet()
{
    auto l = LFLogger::create();
    std::string errors;
    l->setError(std::make_shared<Pl_String>("errors", nullptr, errors));
    l->setInfo(l->discard());
    l->info("not seen\n");
    *(l->getInfo()) << "also not seen " << 3 << "\n";
    l->warn("still seen\n");
    assert(errors == "still seen\n");
}

static void
test_numbers()
{
    auto l = LFLogger::create();
    std::string info;
    l->setInfo(std::make_shared<Pl_String>("info", nullptr, info));
    size_t bytes = 415927;
    unsigned long long bits = 3327412;
    int64_t negative = -4;
    *(l->getInfo()) << "lzwforge: wrote " << bytes << " bytes (" << bits << " code bits, " << 4
                    << " padding bits)\n";
    *(l->getInfo()) << negative << "\n";
    assert(info == "lzwforge: wrote 415927 bytes (3327412 code bits, 4 padding bits)\n-4\n");
}

static void
test_save()
{
    auto l = LFLogger::create();
    assert(l->getSave(true) == nullptr);
    bool threw = false;
    try {
        l->getSave();
    } catch (std::logic_error& e) {
        std::cout << "getSave: " << e.what() << std::endl;
        threw = true;
    }
    assert(threw);

    // Saving to standard output moves info to standard error.
    l->saveToStandardOutput(true);
    assert(l->getSave() == l->standardOutput());
    assert(l->getInfo() == l->standardError());
    l->setInfo(nullptr);
    assert(l->getInfo() == l->standardError());

    // only_if_not_set leaves an existing save pipeline alone.
    std::string saved;
    auto pl_save = std::make_shared<Pl_String>("save", nullptr, saved);
    l->setSave(pl_save, true);
    assert(l->getSave() == l->standardOutput());

    l->setSave(pl_save, false);
    *(l->getSave()) << "fixture bytes";
    assert(saved == "fixture bytes");
    l->setInfo(nullptr);
    assert(l->getInfo() == l->standardOutput());
}

static void
test_save_after_use()
{
    auto l = LFLogger::create();
    l->info("standard output used\n");
    bool threw = false;
    try {
        l->saveToStandardOutput(true);
    } catch (std::logic_error& e) {
        std::cout << "saveToStandardOutput: " << e.what() << std::endl;
        threw = true;
    }
    assert(threw);
    assert(l->getSave(true) == nullptr);
    assert(l->getInfo() == l->standardOutput());
}

int
main()
{
    try {
        test_routing();
        test_quiet();
        test_numbers();
        test_save();
        test_save_after_use();
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        exit(2);
    }
    std::cout << "done" << std::endl;
    return 0;
}
