/**
 * Sampling and Scoring Helpers
 *
 * Weighted draws over a Node, the keyword edge filter that biases
 * generation, and the terms of the sentence score.
 */

#pragma once

#include "babbler/generative/node.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace babbler::generative {

using Rng = std::mt19937;

constexpr double MIN_EXPONENT = 0.0625;
constexpr double MAX_EXPONENT = 16.0;

// Outcome of one draw. `word` is null for "no word" (exit or empty node).
struct SampleOutcome {
    const std::string* word = nullptr;
    double chance = 1.0;
};

// Edges of a node that carry a still-needed keyword
struct KeywordEdges {
    std::vector<size_t> edges;   // indices into Node::links, ascending
    uint64_t weight = 0;         // sum of their frequencies
};

// Clamp alpha/beta to [MIN_EXPONENT, MAX_EXPONENT]; NaN maps to the minimum
double clamp_exponent(double value);

// Draw over the whole node; the exit share yields a null word with chance 1.0
SampleOutcome sample_node(const Node& node, Rng& rng);

// Draw restricted to `subset` (weight = sum of the subset frequencies)
SampleOutcome sample_edges(const Node& node, const KeywordEdges& subset, Rng& rng);

/**
 * Collect edges whose lowercased word contains any of `remaining` and
 * which are not already listed in `found`. `remaining` must be lowercase.
 */
KeywordEdges filter_keyword_edges(const Node& node,
                                  const std::vector<std::string>& remaining,
                                  const std::vector<std::string>& found);

// (1/chance)^alpha, or 0 when chance is not positive
double edge_score(double chance, double alpha);

// score * found_count^beta
double final_score(double score, size_t found_count, double beta);

} // namespace babbler::generative
