#include <lzwforge/CodeReader.hh>
#include <lzwforge/Constants.h>
#include <lzwforge/DLL.h>
#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFLogger.hh>
#include <lzwforge/LFTC.hh>
#include <lzwforge/LFUsage.hh>
#include <lzwforge/LFUtil.hh>
#include <lzwforge/MaliciousFixture.hh>
#include <lzwforge/Pl_Count.hh>
#include <lzwforge/Pl_Flate.hh>
#include <lzwforge/Pl_StdioFile.hh>
#include <lzwforge/Pl_String.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static char const* whoami = nullptr;

namespace
{
    struct Options
    {
        char const* outfile{nullptr};
        char const* limit{nullptr};
        char const* filler_count{nullptr};
        char const* injected_code{nullptr};
        char const* padding{nullptr};
        char const* overflow{nullptr};
        char const* compression_level{nullptr};
        bool reference{false};
        bool deflate{false};
        bool verify{false};
        bool quiet{false};
    };
} // namespace

static void
usage()
{
    std::cerr
        << "Usage: " << whoami << " [options] outfile" << std::endl
        << "Write an adversarial LZW fixture to outfile, or to standard output if outfile is -."
        << std::endl
        << std::endl
        << "  --limit=N              size the filler segment as N - 4096 codes (default "
        << MaliciousFixture::default_limit << ")" << std::endl
        << "  --filler-count=N       repeat the 12-bit filler code exactly N times" << std::endl
        << "  --injected-code=N      code placed at index 1 of the 9-bit segment (default "
        << MaliciousFixture::default_injected_code << ")" << std::endl
        << "  --padding=aligned|always" << std::endl
        << "                         pad only a partial final byte, or always add padding"
        << std::endl
        << "  --overflow=expand|truncate|strict" << std::endl
        << "                         handling of codes that don't fit their width" << std::endl
        << "  --reference            reproduce the historical generator's output byte for byte"
        << std::endl
        << "  --deflate[=level]      zlib-compress the output; level is 1 to 9" << std::endl
        << "  --verify               read the codes back and check them against the fixture"
        << std::endl
        << "  --quiet                don't print a summary" << std::endl
        << "  --version              show version and exit" << std::endl;
}

static void
usageExit(std::string const& msg)
{
    std::cerr << whoami << ": " << msg << std::endl << std::endl;
    usage();
    exit(lzwforge_exit_error);
}

static char const*
option_value(char const* arg, char const* name)
{
    size_t len = strlen(name);
    if ((strncmp(arg, name, len) == 0) && (arg[len] == '=')) {
        return arg + len + 1;
    }
    return nullptr;
}

static Options
parse_args(int argc, char* argv[])
{
    Options o;
    for (int i = 1; i < argc; ++i) {
        char const* arg = argv[i];
        char const* value = nullptr;
        if ((value = option_value(arg, "--limit"))) {
            o.limit = value;
        } else if ((value = option_value(arg, "--filler-count"))) {
            o.filler_count = value;
        } else if ((value = option_value(arg, "--injected-code"))) {
            o.injected_code = value;
        } else if ((value = option_value(arg, "--padding"))) {
            o.padding = value;
        } else if ((value = option_value(arg, "--overflow"))) {
            o.overflow = value;
        } else if ((value = option_value(arg, "--deflate"))) {
            o.deflate = true;
            o.compression_level = value;
        } else if (strcmp(arg, "--deflate") == 0) {
            o.deflate = true;
        } else if (strcmp(arg, "--reference") == 0) {
            o.reference = true;
        } else if (strcmp(arg, "--verify") == 0) {
            o.verify = true;
        } else if (strcmp(arg, "--quiet") == 0) {
            o.quiet = true;
        } else if ((arg[0] == '-') && (arg[1] != '\0')) {
            throw LFUsage(std::string("unknown option ") + arg);
        } else if (o.outfile) {
            throw LFUsage("only one output file may be given");
        } else {
            o.outfile = arg;
        }
    }
    if (o.outfile == nullptr) {
        throw LFUsage("an output file is required");
    }
    return o;
}

static unsigned long long
number_arg(char const* option, char const* value)
{
    try {
        return LFUtil::string_to_ull(value);
    } catch (std::runtime_error& e) {
        throw LFUsage(std::string(option) + ": " + e.what());
    }
}

static void
configure(MaliciousFixture& fixture, Options const& o)
{
    if (o.limit) {
        fixture.setLimit(number_arg("--limit", o.limit));
    }
    // Explicit options given with --reference override the parts of it they name.
    if (o.reference) {
        fixture.setReferenceCompatibility();
    }
    if (o.filler_count) {
        fixture.setFillerCount(number_arg("--filler-count", o.filler_count));
    }
    if (o.injected_code) {
        fixture.setInjectedCode(number_arg("--injected-code", o.injected_code));
    }
    if (o.padding) {
        if (strcmp(o.padding, "aligned") == 0) {
            fixture.setPadding(lzwforge_pad_aligned);
        } else if (strcmp(o.padding, "always") == 0) {
            fixture.setPadding(lzwforge_pad_always);
        } else {
            throw LFUsage(std::string("--padding: invalid value ") + o.padding);
        }
    }
    if (o.overflow) {
        if (strcmp(o.overflow, "expand") == 0) {
            fixture.setOverflow(lzwforge_overflow_expand);
        } else if (strcmp(o.overflow, "truncate") == 0) {
            fixture.setOverflow(lzwforge_overflow_truncate);
        } else if (strcmp(o.overflow, "strict") == 0) {
            fixture.setOverflow(lzwforge_overflow_strict);
        } else {
            throw LFUsage(std::string("--overflow: invalid value ") + o.overflow);
        }
    }
    if (o.compression_level) {
        auto level = number_arg("--deflate", o.compression_level);
        if ((level < 1) || (level > 9)) {
            throw LFUsage("--deflate: compression level must be from 1 to 9");
        }
        Pl_Flate::setCompressionLevel(static_cast<int>(level));
    }
}

static int
run(Options const& o)
{
    auto logger = LFLogger::defaultLogger();
    if (o.quiet) {
        logger->setInfo(logger->discard());
    }

    MaliciousFixture fixture;
    configure(fixture, o);

    bool to_stdout = (strcmp(o.outfile, "-") == 0);
    std::unique_ptr<LFUtil::FileCloser> fc;
    std::shared_ptr<Pipeline> sink;
    if (to_stdout) {
        logger->saveToStandardOutput(true);
        sink = logger->getSave();
    } else {
        fc = std::make_unique<LFUtil::FileCloser>(LFUtil::safe_fopen(o.outfile, "wb"));
        sink = std::make_shared<Pl_StdioFile>(o.outfile, fc->f);
    }

    // Output chain: [capture] -> raw count -> [deflate] -> output count -> sink. The packed bytes
    // are only held in memory when they are needed for verification.
    Pl_Count count("count", sink.get());
    Pipeline* target = &count;
    std::unique_ptr<Pl_Flate> flate;
    if (o.deflate) {
        flate = std::make_unique<Pl_Flate>("deflate", target, Pl_Flate::a_deflate);
        flate->setWarnCallback([logger](char const* msg, int) {
            logger->warn(std::string(whoami) + ": WARNING: " + msg + "\n");
        });
        target = flate.get();
    }
    Pl_Count raw_count("raw count", target);
    target = &raw_count;
    std::string packed;
    std::unique_ptr<Pl_String> capture;
    if (o.verify) {
        capture = std::make_unique<Pl_String>("capture", target, packed);
        target = capture.get();
    }
    LFTC::TC("lzwforge", "lzwforge capture packed data", o.verify ? 1 : 0);
    fixture.write(target);
    if (fc) {
        fc->close(std::string("close ") + o.outfile);
    }

    auto code_bits = fixture.getBitCount();
    auto packed_size = LFIntC::to_ulonglong(raw_count.getCount());
    std::string destination = to_stdout ? "standard output" : o.outfile;
    *logger->getInfo() << whoami << ": wrote " << packed_size << " bytes to " << destination
                       << " (" << code_bits << " code bits, " << (packed_size * 8 - code_bits)
                       << " padding bits)\n";
    if (o.deflate) {
        *logger->getInfo() << whoami << ": deflated to " << count.getCount() << " bytes\n";
    }

    if (o.verify) {
        std::string problem;
        if (!CodeReader::verify(
                packed,
                fixture.getSegments(),
                fixture.getPadding(),
                fixture.getOverflow(),
                problem)) {
            logger->warn(std::string(whoami) + ": WARNING: verification failed: " + problem + "\n");
            return lzwforge_exit_warning;
        }
        *logger->getInfo() << whoami << ": verified " << fixture.getSegments().size()
                           << " segments\n";
    }
    return lzwforge_exit_success;
}

int
main(int argc, char* argv[])
{
    whoami = LFUtil::getWhoami(argv[0]);

    if ((argc == 2) && (strcmp(argv[1], "--version") == 0)) {
        std::cout << whoami << " version " << LZWFORGE_VERSION << std::endl;
        return lzwforge_exit_success;
    }
    if ((argc == 2) && (strcmp(argv[1], "--help") == 0)) {
        usage();
        return lzwforge_exit_success;
    }

    try {
        return run(parse_args(argc, argv));
    } catch (LFUsage& e) {
        usageExit(e.what());
    } catch (std::exception& e) {
        LFLogger::defaultLogger()->error(std::string(whoami) + ": " + e.what() + "\n");
    }
    return lzwforge_exit_error;
}
