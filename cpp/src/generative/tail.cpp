#include "babbler/generative/tail.hpp"
#include "babbler/util/utf8.hpp"

#include <algorithm>

namespace babbler::generative {

Tail::Tail(size_t order) : order_(std::max<size_t>(1, order)) {}

void Tail::push(const std::string& token) {
    tokens_.push_back(util::to_lower_utf8(token));
    if (tokens_.size() > order_) {
        tokens_.pop_front();
    }
    rebuild_key();
}

void Tail::clear() {
    tokens_.clear();
    key_.clear();
}

void Tail::rebuild_key() {
    size_t total = 0;
    for (const auto& t : tokens_) total += t.size();

    key_.clear();
    key_.reserve(total);
    for (const auto& t : tokens_) key_ += t;
}

} // namespace babbler::generative
