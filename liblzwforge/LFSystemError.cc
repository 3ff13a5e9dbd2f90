#include <lzwforge/LFSystemError.hh>

#include <cstring>

LFSystemError::LFSystemError(std::string const& description, int system_errno) :
    std::runtime_error(createWhat(description, system_errno)),
    description(description),
    system_errno(system_errno)
{
}

std::string
LFSystemError::createWhat(std::string const& description, int system_errno)
{
    std::string message;
#ifdef _MSC_VER
    // "94" is mentioned in the MSVC docs, but it's still safe if the message is longer. strerror_s
    // is not compatible with the C11 version.
    char buf[94];
    strerror_s(buf, sizeof(buf), system_errno);
    message = description + ": " + buf;
#else
    message = description + ": " + strerror(system_errno);
#endif
    return message;
}

std::string const&
LFSystemError::getDescription() const
{
    return this->description;
}

int
LFSystemError::getErrno() const
{
    return this->system_errno;
}
