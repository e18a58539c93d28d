#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace babbler::generative {

struct GenerationConfig {
    // Chain
    int64_t order = 4;

    // Lengths in tokens; max_length 0 means twice sentence_length
    size_t sentence_length = 50;
    size_t max_length = 0;

    // Scoring constants
    double alpha = 2.0;
    double beta = 1.5;

    // Best-of-N
    size_t sample_count = 1000;
    size_t num_threads = 1;

    std::vector<std::string> keywords;

    size_t effective_max_length() const {
        return max_length > 0 ? max_length : sentence_length * 2;
    }
};

// Defaults overridden by the generate.* and chain.* keys of Config
GenerationConfig load_generation_config();

} // namespace babbler::generative
