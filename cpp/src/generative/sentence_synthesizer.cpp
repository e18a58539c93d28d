#include "babbler/generative/sentence_synthesizer.hpp"
#include "babbler/error.hpp"
#include "babbler/logging.hpp"

#include <algorithm>
#include <sstream>

namespace babbler::generative {

namespace {

std::string join_keywords(const std::vector<std::string>& keywords) {
    std::ostringstream ss;
    for (size_t i = 0; i < keywords.size(); ++i) {
        if (i > 0) ss << ' ';
        ss << keywords[i];
    }
    return ss.str();
}

// Keep `a` unless `b` scores strictly higher
GenerationResult better_of(GenerationResult a, GenerationResult b) {
    return (b.score > a.score) ? std::move(b) : std::move(a);
}

} // namespace

SentenceSynthesizer::SentenceSynthesizer(const ChainModel& model, size_t num_threads)
    : model_(model)
    , num_threads_(std::max<size_t>(1, num_threads)) {
    if (num_threads_ > 1) {
        pool_ = std::make_unique<ThreadPool>(num_threads_);
    }
}

SentenceSynthesizer::~SentenceSynthesizer() = default;

GenerationResult SentenceSynthesizer::generate(size_t target_length,
                                               size_t max_length,
                                               const std::vector<std::string>& keywords,
                                               size_t sample_count,
                                               double alpha,
                                               double beta,
                                               Rng& rng) const {
    LOG_DEBUG("Generating a sentence about: ", join_keywords(keywords));

    GenerationResult best;
    if (num_threads_ == 1 || sample_count < 2) {
        best = best_of(sample_count, target_length, max_length, keywords, alpha, beta, rng);
    } else {
        BABBLER_CHECK(pool_ != nullptr, ErrorCode::INTERNAL_ERROR, "thread pool missing");

        const size_t chunks = std::min(num_threads_, sample_count);

        // Seeds are drawn up front in chunk order so results depend only on
        // the caller's seed and the thread count
        std::vector<Rng::result_type> seeds(chunks);
        for (auto& seed : seeds) seed = rng();

        best = pool_->parallel_reduce(size_t(0), chunks, GenerationResult{},
            [&](GenerationResult init, size_t chunk) {
                const size_t count = sample_count / chunks + (chunk < sample_count % chunks ? 1 : 0);
                Rng local(seeds[chunk]);
                return better_of(std::move(init),
                    best_of(count, target_length, max_length, keywords, alpha, beta, local));
            },
            [](GenerationResult a, GenerationResult b) {
                return better_of(std::move(a), std::move(b));
            });
    }

    LOG_DEBUG("Generated sentence (score ", best.score, "): ", best.text);
    return best;
}

GenerationResult SentenceSynthesizer::generate(const GenerationConfig& config, Rng& rng) const {
    return generate(config.sentence_length, config.effective_max_length(), config.keywords,
                    config.sample_count, config.alpha, config.beta, rng);
}

GenerationResult SentenceSynthesizer::best_of(size_t count,
                                              size_t target_length,
                                              size_t max_length,
                                              const std::vector<std::string>& keywords,
                                              double alpha,
                                              double beta,
                                              Rng& rng) const {
    GenerationResult candidate;
    for (size_t i = 0; i < count; ++i) {
        GenerationResult result = model_.generate_once(target_length, max_length, keywords, alpha, beta, rng);
        if (result.score > candidate.score) {
            candidate = std::move(result);
        }
    }
    return candidate;
}

} // namespace babbler::generative
