/**
 * Chain Node and Snapshot Types
 *
 * A Node is the per-context record of a Markov chain: the words observed
 * after its tail, how often each was observed, and how often the tail ended
 * an ingested sequence.
 *
 * Invariants (maintained by ChainModel::analyze, checked on reconstruction):
 * - links and freqs have the same length and are index-aligned
 * - links holds no duplicates, every frequency is at least 1
 * - weight == sum(freqs) + number of times the tail was a terminal context
 * - is_exit is true exactly when that terminal count is nonzero
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace babbler::generative {

struct Node {
    std::vector<std::string> links;   // outgoing words, insertion order, original case
    std::vector<uint64_t> freqs;      // parallel to links
    uint64_t weight = 0;              // sum(freqs) + exit count
    bool is_exit = false;

    uint64_t edge_weight() const {
        uint64_t sum = 0;
        for (uint64_t f : freqs) sum += f;
        return sum;
    }

    // Weight reserved for "the sequence ends here"
    uint64_t exit_weight() const { return weight - edge_weight(); }

    bool unknown() const { return weight == 0; }

    bool operator==(const Node& other) const {
        return links == other.links && freqs == other.freqs &&
               weight == other.weight && is_exit == other.is_exit;
    }
    bool operator!=(const Node& other) const { return !(*this == other); }
};

/**
 * Persistence-ready export of a chain: the order plus every tail with its
 * node, in node creation order.
 */
struct ChainSnapshot {
    int64_t order = 1;
    std::vector<std::pair<std::string, Node>> graph;

    bool operator==(const ChainSnapshot& other) const {
        return order == other.order && graph == other.graph;
    }
    bool operator!=(const ChainSnapshot& other) const { return !(*this == other); }
};

} // namespace babbler::generative
