#include <lzwforge/LFUtil.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <set>
#include <string>

static char const* whoami = nullptr;

void
usage()
{
    std::cerr << "Usage: " << whoami << " testcov recorded" << '\n'
              << R"(Where "testcov" lists the coverage cases a scope must reach, one "case n")" << '\n'
              << R"(per line, and "recorded" is the file named by TC_FILENAME while the tests)" << '\n'
              << "ran with TC_SCOPE set to that scope. Every listed case must have been" << '\n'
              << "recorded, and every recorded case must be listed." << '\n';
    exit(2);
}

// Read non-blank lines, dropping trailing whitespace. If comments is true, lines starting with #
// are skipped.
std::set<std::string>
read_cases(char const* filename, bool comments)
{
    LFUtil::FileCloser fc(LFUtil::safe_fopen(filename, "rb"));
    std::string data;
    char buf[2048];
    size_t len;
    while ((len = fread(buf, 1, sizeof(buf), fc.f)) > 0) {
        data.append(buf, len);
    }
    fc.close(std::string("close ") + filename);

    std::set<std::string> result;
    size_t start = 0;
    while (start < data.size()) {
        auto end = data.find('\n', start);
        if (end == std::string::npos) {
            end = data.size();
        }
        auto line = data.substr(start, end - start);
        start = end + 1;
        auto last = line.find_last_not_of(" \t\r");
        if (last == std::string::npos) {
            continue;
        }
        line.erase(last + 1);
        if (comments && (line.at(0) == '#')) {
            continue;
        }
        result.insert(line);
    }
    return result;
}

int
main(int argc, char* argv[])
{
    if ((whoami = strrchr(argv[0], '/')) == nullptr) {
        whoami = argv[0];
    } else {
        ++whoami;
    }

    if (argc != 3) {
        usage();
    }

    try {
        auto expected = read_cases(argv[1], true);
        auto recorded = read_cases(argv[2], false);
        bool okay = true;
        for (auto const& c: expected) {
            if (recorded.count(c) == 0) {
                std::cerr << whoami << ": missing coverage case: " << c << '\n';
                okay = false;
            }
        }
        for (auto const& c: recorded) {
            if (expected.count(c) == 0) {
                std::cerr << whoami << ": unexpected coverage case: " << c << '\n';
                okay = false;
            }
        }
        if (!okay) {
            exit(2);
        }
        std::cout << whoami << ": " << expected.size() << " coverage cases reached" << '\n';
    } catch (std::exception& e) {
        std::cerr << whoami << ": " << e.what() << '\n';
        exit(2);
    }
    return 0;
}
