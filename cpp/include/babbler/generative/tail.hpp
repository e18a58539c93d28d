#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace babbler::generative {

/**
 * Sliding context window of the most recent `order` tokens.
 *
 * Tokens are held lowercased. The lookup key is their plain concatenation,
 * which is also the key format of persisted snapshots: ["ab", "c"] and
 * ["a", "bc"] share the key "abc".
 */
class Tail {
public:
    explicit Tail(size_t order);

    // Append a token, evicting the oldest one past `order`
    void push(const std::string& token);
    void clear();

    const std::string& key() const { return key_; }
    const std::deque<std::string>& tokens() const { return tokens_; }
    size_t order() const { return order_; }
    size_t size() const { return tokens_.size(); }
    bool empty() const { return tokens_.empty(); }

    bool operator==(const Tail& other) const { return tokens_ == other.tokens_; }
    bool operator!=(const Tail& other) const { return !(*this == other); }

private:
    void rebuild_key();

    size_t order_;
    std::deque<std::string> tokens_;
    std::string key_;
};

} // namespace babbler::generative
