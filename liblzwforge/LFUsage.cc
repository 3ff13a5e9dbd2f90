#include <lzwforge/LFUsage.hh>

LFUsage::LFUsage(std::string const& msg) :
    std::runtime_error(msg)
{
}
