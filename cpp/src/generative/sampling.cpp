#include "babbler/generative/sampling.hpp"
#include "babbler/util/utf8.hpp"

#include <algorithm>
#include <cmath>

namespace babbler::generative {

namespace {

uint64_t draw_pick(uint64_t weight, Rng& rng) {
    std::uniform_int_distribution<uint64_t> dist(0, weight - 1);
    return dist(rng);
}

} // namespace

double clamp_exponent(double value) {
    if (std::isnan(value)) return MIN_EXPONENT;
    return std::max(MIN_EXPONENT, std::min(MAX_EXPONENT, value));
}

SampleOutcome sample_node(const Node& node, Rng& rng) {
    SampleOutcome outcome;
    if (node.weight == 0) return outcome;

    uint64_t pick = draw_pick(node.weight, rng);
    for (size_t edge = 0; edge < node.freqs.size(); ++edge) {
        const uint64_t freq = node.freqs[edge];
        if (pick < freq) {
            outcome.word = &node.links[edge];
            outcome.chance = static_cast<double>(freq) / static_cast<double>(node.weight);
            return outcome;
        }
        pick -= freq;
    }

    // Landed in the exit share
    return outcome;
}

SampleOutcome sample_edges(const Node& node, const KeywordEdges& subset, Rng& rng) {
    SampleOutcome outcome;
    if (subset.weight == 0) return outcome;

    uint64_t pick = draw_pick(subset.weight, rng);
    for (size_t edge : subset.edges) {
        const uint64_t freq = node.freqs[edge];
        if (pick < freq) {
            outcome.word = &node.links[edge];
            outcome.chance = static_cast<double>(freq) / static_cast<double>(subset.weight);
            return outcome;
        }
        pick -= freq;
    }

    return outcome;
}

KeywordEdges filter_keyword_edges(const Node& node,
                                  const std::vector<std::string>& remaining,
                                  const std::vector<std::string>& found) {
    KeywordEdges result;
    if (remaining.empty()) return result;

    for (size_t i = 0; i < node.links.size(); ++i) {
        const std::string& word = node.links[i];
        if (std::find(found.begin(), found.end(), word) != found.end()) continue;

        const std::string lowercase = util::to_lower_utf8(word);
        const bool matches = std::any_of(remaining.begin(), remaining.end(),
            [&](const std::string& keyword) { return lowercase.find(keyword) != std::string::npos; });

        if (matches) {
            result.edges.push_back(i);
            result.weight += node.freqs[i];
        }
    }

    return result;
}

double edge_score(double chance, double alpha) {
    if (!(chance > 0.0)) return 0.0;
    return std::pow(1.0 / chance, alpha);
}

double final_score(double score, size_t found_count, double beta) {
    return score * std::pow(static_cast<double>(found_count), beta);
}

} // namespace babbler::generative
