/**
 * Best-of-N Sentence Synthesis
 *
 * A single ChainModel::generate_once draw has high variance. The
 * synthesizer runs sample_count independent attempts and keeps the one with
 * the strictly highest score; ties keep the earliest attempt.
 */

#pragma once

#include "babbler/generative/chain_model.hpp"
#include "babbler/generative/generation_config.hpp"
#include "babbler/thread_pool.hpp"

#include <memory>
#include <string>
#include <vector>

namespace babbler::generative {

class SentenceSynthesizer {
public:
    /**
     * @param model       Chain to sample from; must outlive the synthesizer and
     *                    must not be analyzed while generate() runs
     * @param num_threads 1 runs attempts inline on the caller's generator;
     *                    more splits them over a pool, one seeded generator
     *                    per chunk
     */
    explicit SentenceSynthesizer(const ChainModel& model, size_t num_threads = 1);
    ~SentenceSynthesizer();

    SentenceSynthesizer(const SentenceSynthesizer&) = delete;
    SentenceSynthesizer& operator=(const SentenceSynthesizer&) = delete;

    GenerationResult generate(size_t target_length,
                              size_t max_length,
                              const std::vector<std::string>& keywords,
                              size_t sample_count,
                              double alpha,
                              double beta,
                              Rng& rng) const;

    GenerationResult generate(const GenerationConfig& config, Rng& rng) const;

    size_t num_threads() const { return num_threads_; }

private:
    GenerationResult best_of(size_t count,
                             size_t target_length,
                             size_t max_length,
                             const std::vector<std::string>& keywords,
                             double alpha,
                             double beta,
                             Rng& rng) const;

    const ChainModel& model_;
    size_t num_threads_;
    std::unique_ptr<ThreadPool> pool_;
};

} // namespace babbler::generative
