/**
 * Bounded-Context Markov Chain
 *
 * Learns word transitions from token sequences and synthesizes text biased
 * toward caller-supplied keywords:
 * - order-k context window (see Tail)
 * - exit weight competing with continuation at every context
 * - keyword-filtered edge sampling
 * - rarity score: sum of (1/chance)^alpha, scaled by found^beta
 */

#ifndef BABBLER_GENERATIVE_CHAIN_MODEL_HPP
#define BABBLER_GENERATIVE_CHAIN_MODEL_HPP

#include "babbler/generative/node.hpp"
#include "babbler/generative/sampling.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace babbler::generative {

// Synthesized text and its score. Empty text with score 0 means no valid stop.
struct GenerationResult {
    std::string text;
    double score = 0.0;
};

class ChainModel {
public:
    // Orders below 1 are raised to 1
    explicit ChainModel(int64_t order);

    /**
     * Rebuild a model from an exported snapshot.
     *
     * @throws SnapshotError if a node record breaks the Node invariants or a
     *         tail appears twice
     */
    static ChainModel from_snapshot(const ChainSnapshot& snapshot);

    /**
     * Ingest one unit of text (one or more sentences). Every token becomes a
     * transition from the context formed by the preceding tokens; the final
     * context receives one unit of exit weight. Empty input is ignored.
     */
    void analyze(const std::vector<std::string>& tokens);

    /**
     * One stochastic generation attempt.
     *
     * @param target_length Steps after which the attempt may stop at an exit context
     * @param max_length    Hard step limit; reaching it without a stop fails the attempt
     * @param keywords      Words to steer toward (case-insensitive substring match)
     * @param alpha         Rarity exponent, clamped to [0.0625, 16]
     * @param beta          Keyword-count exponent, clamped to [0.0625, 16]
     * @param rng           Random source; the model itself is not modified
     * @return The text and score, or an empty result when the attempt failed
     */
    GenerationResult generate_once(size_t target_length,
                                   size_t max_length,
                                   const std::vector<std::string>& keywords,
                                   double alpha,
                                   double beta,
                                   Rng& rng) const;

    ChainSnapshot to_snapshot() const;

    // Lookup by tail key (lowercased concatenation); nullptr if never created
    const Node* find_node(const std::string& tail_key) const;

    size_t order() const { return order_; }
    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const;

private:
    Node& node_at(const std::string& tail_key);

    size_t order_;

    // Arena of nodes; tails_ is parallel to nodes_
    std::vector<Node> nodes_;
    std::vector<std::string> tails_;
    std::unordered_map<std::string, size_t> tail_index_;
};

} // namespace babbler::generative

#endif // BABBLER_GENERATIVE_CHAIN_MODEL_HPP
