#include <lzwforge/LFTC.hh>

#include <lzwforge/LFUtil.hh>

#include <cstdio>
#include <map>
#include <set>
#include <string>

static bool
tc_active(char const* const scope)
{
    std::string value;
    return (LFUtil::get_env("TC_SCOPE", &value) && (value == scope));
}

void
LFTC::TC_real(char const* const scope, char const* const ccase, int n)
{
    static std::map<std::string, bool> active;
    auto is_active = active.find(scope);
    if (is_active == active.end()) {
        is_active = active.insert(std::make_pair(std::string(scope), tc_active(scope))).first;
    }

    if (!is_active->second) {
        return;
    }

    static std::set<std::pair<std::string, int>> cache;

    std::string filename;
    if (!LFUtil::get_env("TC_FILENAME", &filename)) {
        return;
    }

    if (!cache.insert(std::make_pair(std::string(ccase), n)).second) {
        return;
    }

    LFUtil::FileCloser tc(LFUtil::safe_fopen(filename.c_str(), "ab"));
    fprintf(tc.f, "%s %d\n", ccase, n);
}
