#include "babbler/generative/generation_config.hpp"
#include "babbler/config.hpp"

#include <algorithm>

namespace babbler::generative {

namespace {

size_t get_count(const Config& config, const char* key, size_t fallback, long long floor) {
    long long value = config.get<long long>(key, static_cast<long long>(fallback));
    return static_cast<size_t>(std::max(floor, value));
}

} // namespace

GenerationConfig load_generation_config() {
    const Config& config = Config::getInstance();
    GenerationConfig result;

    result.order = std::max<long long>(1, config.get<long long>("chain.order", result.order));
    result.sentence_length = get_count(config, "generate.sentence_length", result.sentence_length, 1);
    result.max_length = get_count(config, "generate.max_length", result.max_length, 0);
    result.sample_count = get_count(config, "generate.sample_count", result.sample_count, 1);
    result.num_threads = get_count(config, "generate.threads", result.num_threads, 1);

    double alpha = config.get<double>("generate.alpha", result.alpha);
    double beta = config.get<double>("generate.beta", result.beta);
    if (alpha > 0.0) result.alpha = alpha;
    if (beta > 0.0) result.beta = beta;

    return result;
}

} // namespace babbler::generative
