#include <lzwforge/LFUtil.hh>

#include <lzwforge/LFIntC.hh>
#include <lzwforge/LFSystemError.hh>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#ifdef _WIN32
# include <fcntl.h>
# include <io.h>
#endif

static bool
is_space(char ch)
{
    return ((ch == ' ') || (ch == '\n') || (ch == '\r') || (ch == '\t') || (ch == '\f') ||
            (ch == '\v'));
}

std::string
LFUtil::uint_to_string(unsigned long long num, int length)
{
    return uint_to_string_base(num, 10, length);
}

std::string
LFUtil::uint_to_string_base(unsigned long long num, int base, int length)
{
    // A positive length prepends zeroes and a negative length appends spaces, matching printf's
    // %0*d and %-*d.
    std::string cvt;
    if (base == 10) {
        cvt = std::to_string(num);
    } else if (base == 2) {
        do {
            cvt.insert(cvt.begin(), (num & 1) ? '1' : '0');
            num >>= 1;
        } while (num);
    } else if ((base == 8) || (base == 16)) {
        std::ostringstream buf;
        buf.imbue(std::locale::classic());
        buf << std::setbase(base) << std::nouppercase << num;
        cvt = buf.str();
    } else {
        throw std::logic_error("uint_to_string_base called with unsupported base");
    }
    std::string result;
    int str_length = LFIntC::to_int(cvt.length());
    if ((length > 0) && (str_length < length)) {
        result.append(LFIntC::to_size(length - str_length), '0');
    }
    result += cvt;
    if ((length < 0) && (str_length < -length)) {
        result.append(LFIntC::to_size(-length - str_length), ' ');
    }
    return result;
}

unsigned long long
LFUtil::string_to_ull(char const* str)
{
    char const* p = str;
    while (*p && is_space(*p)) {
        ++p;
    }
    if (*p == '-') {
        throw std::runtime_error(
            std::string("underflow converting ") + str + " to 64-bit unsigned integer");
    }

    errno = 0;
    char* end = nullptr;
#ifdef _MSC_VER
    unsigned long long result = _strtoui64(p, &end, 10);
#else
    unsigned long long result = strtoull(p, &end, 10);
#endif
    if (errno == ERANGE) {
        throw std::runtime_error(
            std::string("overflow converting ") + str + " to 64-bit unsigned integer");
    }
    if ((end == p) || (*end != '\0')) {
        throw std::runtime_error(std::string("invalid unsigned integer ") + str);
    }
    return result;
}

void
LFUtil::throw_system_error(std::string const& description)
{
    throw LFSystemError(description, errno);
}

FILE*
LFUtil::safe_fopen(char const* filename, char const* mode)
{
    return fopen_wrapper(std::string("open ") + filename, fopen(filename, mode));
}

FILE*
LFUtil::fopen_wrapper(std::string const& description, FILE* f)
{
    if (f == nullptr) {
        throw_system_error(description);
    }
    return f;
}

void
LFUtil::FileCloser::close(std::string const& description)
{
    FILE* to_close = f;
    f = nullptr;
    if (to_close && (fclose(to_close) != 0)) {
        throw_system_error(description);
    }
}

std::string
LFUtil::hex_encode(std::string const& input)
{
    static char const hexchars[] = "0123456789abcdef";
    std::string result;
    result.reserve(2 * input.length());
    for (char c: input) {
        auto ch = static_cast<unsigned char>(c);
        result += hexchars[ch >> 4];
        result += hexchars[ch & 0x0f];
    }
    return result;
}

void
LFUtil::binary_stdout()
{
#if defined(_WIN32)
    _setmode(_fileno(stdout), _O_BINARY);
#endif
}

char*
LFUtil::getWhoami(char* argv0)
{
    char* whoami = nullptr;
    if (((whoami = strrchr(argv0, '/')) == nullptr) &&
        ((whoami = strrchr(argv0, '\\')) == nullptr)) {
        whoami = argv0;
    } else {
        ++whoami;
    }

    if ((strlen(whoami) > 4) && (strcmp(whoami + strlen(whoami) - 4, ".exe") == 0)) {
        whoami[strlen(whoami) - 4] = '\0';
    }

    return whoami;
}

bool
LFUtil::get_env(std::string const& var, std::string* value)
{
    char* p = getenv(var.c_str());
    if (p == nullptr) {
        return false;
    }
    if (value) {
        *value = p;
    }

    return true;
}
