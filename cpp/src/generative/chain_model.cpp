#include "babbler/generative/chain_model.hpp"
#include "babbler/generative/tail.hpp"
#include "babbler/error.hpp"
#include "babbler/logging.hpp"
#include "babbler/util/utf8.hpp"

#include <algorithm>
#include <cstddef>

namespace babbler::generative {

namespace {

void record_transition(Node& node, const std::string& word) {
    auto it = std::find(node.links.begin(), node.links.end(), word);
    if (it == node.links.end()) {
        node.links.push_back(word);
        node.freqs.push_back(1);
    } else {
        ++node.freqs[static_cast<size_t>(it - node.links.begin())];
    }
    ++node.weight;
}

// Lowercase, drop empties, dedup keeping first appearance
std::vector<std::string> normalize_keywords(const std::vector<std::string>& keywords) {
    std::vector<std::string> result;
    result.reserve(keywords.size());
    for (const auto& keyword : keywords) {
        std::string lowered = util::to_lower_utf8(keyword);
        // An empty keyword would match every word; it is ignored instead
        if (lowered.empty()) continue;
        if (std::find(result.begin(), result.end(), lowered) == result.end()) {
            result.push_back(std::move(lowered));
        }
    }
    return result;
}

GenerationResult build_result(const std::string& sentence, double score,
                              size_t found_count, double beta) {
    return GenerationResult{sentence, final_score(score, found_count, beta)};
}

void validate_record(const std::string& tail, const Node& node) {
    const std::string where = "tail '" + tail + "'";

    if (node.links.size() != node.freqs.size()) {
        throw SnapshotError("links and freqs differ in length", where);
    }

    uint64_t sum = 0;
    for (size_t i = 0; i < node.links.size(); ++i) {
        if (node.freqs[i] == 0) {
            throw SnapshotError("zero frequency for link '" + node.links[i] + "'", where);
        }
        if (std::find(node.links.begin(), node.links.begin() + static_cast<std::ptrdiff_t>(i),
                      node.links[i]) != node.links.begin() + static_cast<std::ptrdiff_t>(i)) {
            throw SnapshotError("duplicate link '" + node.links[i] + "'", where);
        }
        if (sum + node.freqs[i] < sum) {
            throw SnapshotError("frequency sum overflows", where);
        }
        sum += node.freqs[i];
    }

    if (node.weight < sum) {
        throw SnapshotError("weight " + std::to_string(node.weight) +
                            " is below the frequency sum " + std::to_string(sum), where);
    }
    if (node.is_exit != (node.weight > sum)) {
        throw SnapshotError("isExit does not match the exit weight", where,
                            "Exit weight is weight minus the sum of freqs");
    }
}

} // namespace

ChainModel::ChainModel(int64_t order)
    : order_(static_cast<size_t>(std::max<int64_t>(1, order))) {}

ChainModel ChainModel::from_snapshot(const ChainSnapshot& snapshot) {
    ChainModel model(snapshot.order);
    model.nodes_.reserve(snapshot.graph.size());
    model.tails_.reserve(snapshot.graph.size());

    for (const auto& [tail, node] : snapshot.graph) {
        validate_record(tail, node);
        if (!model.tail_index_.emplace(tail, model.nodes_.size()).second) {
            throw SnapshotError("duplicate tail '" + tail + "'", "from_snapshot");
        }
        model.nodes_.push_back(node);
        model.tails_.push_back(tail);
    }

    LOG_DEBUG("Restored chain of order ", model.order_, " with ", model.nodes_.size(), " nodes");
    return model;
}

void ChainModel::analyze(const std::vector<std::string>& tokens) {
    if (tokens.empty()) return;

    Tail tail(order_);
    for (const auto& token : tokens) {
        record_transition(node_at(tail.key()), token);
        tail.push(token);
    }

    // Exit weight beyond the edge sum is the chance of ending here
    Node& last = node_at(tail.key());
    ++last.weight;
    last.is_exit = true;
}

GenerationResult ChainModel::generate_once(size_t target_length,
                                           size_t max_length,
                                           const std::vector<std::string>& keywords,
                                           double alpha,
                                           double beta,
                                           Rng& rng) const {
    alpha = clamp_exponent(alpha);
    beta = clamp_exponent(beta);

    const std::vector<std::string> all_keywords = normalize_keywords(keywords);
    std::vector<std::string> remaining = all_keywords;
    std::vector<std::string> found;

    std::string sentence;
    double score = 0.0;
    Tail tail(order_);

    for (size_t step = 0; step < max_length; ++step) {
        const Node* node = find_node(tail.key());
        if (node == nullptr || node->unknown()) {
            break;
        }
        if (step >= target_length && node->is_exit) {
            return build_result(sentence, score, found.size(), beta);
        }

        SampleOutcome outcome;
        KeywordEdges matches;
        if (!remaining.empty()) {
            matches = filter_keyword_edges(*node, remaining, found);
        }
        if (matches.weight > 0) {
            outcome = sample_edges(*node, matches, rng);
        } else {
            outcome = sample_node(*node, rng);
        }

        score += edge_score(outcome.chance, alpha);

        if (outcome.word == nullptr) {
            if (step < target_length) {
                // Soft sentence break: start a new clause from scratch
                sentence += ' ';
                tail.clear();
                continue;
            }
            return build_result(sentence, score, found.size(), beta);
        }

        const std::string& word = *outcome.word;
        tail.push(word);
        sentence += word;

        const std::string lowercase = util::to_lower_utf8(word);
        auto match = std::find_if(remaining.begin(), remaining.end(),
            [&](const std::string& keyword) { return lowercase.find(keyword) != std::string::npos; });

        if (match != remaining.end() && std::find(found.begin(), found.end(), word) == found.end()) {
            found.push_back(word);
            remaining.erase(match);
            if (remaining.empty()) {
                remaining = all_keywords;
            }
        }
    }

    return GenerationResult{};
}

ChainSnapshot ChainModel::to_snapshot() const {
    ChainSnapshot snapshot;
    snapshot.order = static_cast<int64_t>(order_);
    snapshot.graph.reserve(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        snapshot.graph.emplace_back(tails_[i], nodes_[i]);
    }
    return snapshot;
}

const Node* ChainModel::find_node(const std::string& tail_key) const {
    auto it = tail_index_.find(tail_key);
    return (it != tail_index_.end()) ? &nodes_[it->second] : nullptr;
}

size_t ChainModel::edge_count() const {
    size_t count = 0;
    for (const auto& node : nodes_) {
        count += node.links.size();
    }
    return count;
}

Node& ChainModel::node_at(const std::string& tail_key) {
    auto it = tail_index_.find(tail_key);
    if (it != tail_index_.end()) {
        return nodes_[it->second];
    }

    tail_index_.emplace(tail_key, nodes_.size());
    tails_.push_back(tail_key);
    nodes_.emplace_back();
    return nodes_.back();
}

} // namespace babbler::generative
