#include "pcapfin/env.h"

#include <cstdlib>
#include <cstring>

namespace pcapfin {

bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

bool debug_logging() {
    static const bool on = env_bool("PCAPFIN_DEBUG", false);
    return on;
}

} // namespace pcapfin
