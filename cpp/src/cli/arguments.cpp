#include "babbler/cli/arguments.hpp"
#include "babbler/error.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace babbler::cli {

uint64_t parse_count(const std::string& flag, const std::string& value, uint64_t max) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long n = std::strtoull(value.c_str(), &end, 10);
    BABBLER_CHECK_ARGUMENT(!value.empty() && value[0] != '-' && end && *end == '\0',
                           "invalid integer for " + flag + ": '" + value + "'");
    BABBLER_CHECK_ARGUMENT(errno != ERANGE && n <= max,
                           "value for " + flag + " out of range (max " +
                           std::to_string(max) + "): '" + value + "'");
    return static_cast<uint64_t>(n);
}

double parse_real(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    const double d = std::strtod(value.c_str(), &end);
    BABBLER_CHECK_ARGUMENT(!value.empty() && end && *end == '\0' && std::isfinite(d) && d > 0.0,
                           "invalid positive number for " + flag + ": '" + value + "'");
    return d;
}

} // namespace babbler::cli
