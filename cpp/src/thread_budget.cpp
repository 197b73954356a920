#include "pcapfin/thread_budget.h"
#include "pcapfin/errors.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <thread>

namespace pcapfin {

namespace {

static std::string trim_upper(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    std::string out = s.substr(b, e - b);
    for (auto& c : out) c = (char)std::toupper((unsigned char)c);
    return out;
}

// optional sign + digits, whole string
static bool parse_int(const std::string& s, long long& out) {
    if (s.empty()) return false;
    size_t i = 0;
    bool neg = false;
    if (s[0] == '+' || s[0] == '-') {
        neg = (s[0] == '-');
        i = 1;
    }
    if (i == s.size()) return false;

    long long v = 0;
    for (; i < s.size(); ++i) {
        const unsigned char c = (unsigned char)s[i];
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
        if (v > (long long)std::numeric_limits<int32_t>::max()) return false;
    }
    out = neg ? -v : v;
    return true;
}

[[noreturn]] static void bad_budget(const std::string& raw) {
    throw JobException(ErrorCode::ConfigurationError,
                       "Unable to set number of threads for finalizing from property value '" + raw + "'");
}

} // namespace

unsigned available_processing_units() {
    unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 1;
    return hw;
}

unsigned resolve_thread_budget(const std::string& raw, unsigned available_units) {
    const std::string s = trim_upper(raw);

    long long n = 0;
    if (!s.empty() && s.back() == 'C') {
        long long factor = 0;
        if (!parse_int(s.substr(0, s.size() - 1), factor)) bad_budget(raw);
        n = factor * (long long)available_units;
    } else {
        if (!parse_int(s, n)) bad_budget(raw);
    }

    if (n < 1 || n > (long long)std::numeric_limits<unsigned>::max()) bad_budget(raw);
    return (unsigned)n;
}

unsigned resolve_thread_budget(const std::string& raw) {
    return resolve_thread_budget(raw, available_processing_units());
}

} // namespace pcapfin
