#pragma once

#include <cstdint>
#include <limits>
#include <string>

namespace babbler::cli {

// Parse a non-negative decimal integer option value no larger than `max`.
// @throws InvalidArgumentError naming `flag` on malformed or out-of-range input
uint64_t parse_count(const std::string& flag, const std::string& value,
                     uint64_t max = std::numeric_limits<uint64_t>::max());

// Parse a positive finite real option value.
// @throws InvalidArgumentError naming `flag` on malformed input
double parse_real(const std::string& flag, const std::string& value);

} // namespace babbler::cli
