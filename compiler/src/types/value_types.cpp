#include "types/value_types.hpp"

#include <algorithm>
#include <iterator>

namespace stencil::types {

namespace {

auto common_prefix_len(std::string_view a, std::string_view b) -> size_t {
    size_t len = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < len && a[i] == b[i]) {
        ++i;
    }
    return i;
}

} // namespace

// ============================================================================
// SortedIdIndex
// ============================================================================

SortedIdIndex::SortedIdIndex(std::vector<std::string> ids) : ids_(std::move(ids)) {
    std::sort(ids_.begin(), ids_.end());
    ids_.erase(std::unique(ids_.begin(), ids_.end()), ids_.end());
}

auto SortedIdIndex::shortest_unique_prefix_len(std::string_view hex) const -> size_t {
    auto it = std::lower_bound(
        ids_.begin(), ids_.end(), hex,
        [](const std::string& id, std::string_view key) { return id < key; });

    size_t shared = 0;
    // The id itself may be in the index; it never counts as a neighbour.
    auto next = it;
    if (next != ids_.end() && *next == hex) {
        ++next;
    }
    if (next != ids_.end()) {
        shared = std::max(shared, common_prefix_len(hex, *next));
    }
    if (it != ids_.begin()) {
        shared = std::max(shared, common_prefix_len(hex, *std::prev(it)));
    }

    return std::min(shared + 1, std::max<size_t>(hex.size(), 1));
}

// ============================================================================
// Ids
// ============================================================================

auto ShortestIdPrefix::with_brackets() const -> std::string {
    if (rest.empty()) {
        return prefix;
    }
    return prefix + "[" + rest + "]";
}

CommitOrChangeId::CommitOrChangeId(std::string hex) : hex_(std::move(hex)) {}

CommitOrChangeId::CommitOrChangeId(std::string hex, Rc<const IdIndex> index)
    : hex_(std::move(hex)), index_(std::move(index)) {}

auto CommitOrChangeId::short_hex(size_t len) const -> std::string {
    return hex_.substr(0, std::min(len, hex_.size()));
}

auto CommitOrChangeId::shortest(size_t total_len) const -> ShortestIdPrefix {
    size_t prefix_len = index_ ? index_->shortest_unique_prefix_len(hex_) : hex_.size();
    prefix_len = std::min(prefix_len, hex_.size());
    size_t rest_len = std::min(std::max(prefix_len, total_len), hex_.size()) - prefix_len;

    return ShortestIdPrefix{.prefix = hex_.substr(0, prefix_len),
                            .rest = hex_.substr(prefix_len, rest_len)};
}

// ============================================================================
// Signature
// ============================================================================

auto Signature::username() const -> std::string {
    auto at = email.find('@');
    if (at == std::string::npos) {
        return email;
    }
    return email.substr(0, at);
}

} // namespace stencil::types
