//! # Record Value Types
//!
//! The structured values a template can extract from a record, besides the
//! scalar string, boolean and integer kinds.
//!
//! | Type               | Display form                               |
//! |--------------------|--------------------------------------------|
//! | `CommitOrChangeId` | full hex id                                |
//! | `ShortestIdPrefix` | prefix (label `prefix`) + rest (label `rest`) |
//! | `Signature`        | `name <email>`                             |
//! | `Timestamp`        | `2023-01-02 03:04:05.678 +09:00`           |
//!
//! Ids can be shortened to their shortest unambiguous prefix. Which prefix is
//! unambiguous depends on the set of ids in the repository, so the id carries
//! an `IdIndex` that knows that set.

#ifndef STENCIL_TYPES_VALUE_TYPES_HPP
#define STENCIL_TYPES_VALUE_TYPES_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::types {

// ============================================================================
// Id Index
// ============================================================================

/// Answers "how many hex digits make this id unambiguous?".
class IdIndex {
public:
    virtual ~IdIndex() = default;

    /// Length of the shortest prefix of `hex` that no other indexed id shares.
    ///
    /// The result is at least 1 and at most `hex.size()`.
    [[nodiscard]] virtual auto shortest_unique_prefix_len(std::string_view hex) const
        -> size_t = 0;
};

/// An `IdIndex` over a fixed set of ids, kept sorted.
///
/// The unique prefix of an id is one digit longer than the longest prefix it
/// shares with its sorted neighbours.
class SortedIdIndex : public IdIndex {
public:
    explicit SortedIdIndex(std::vector<std::string> ids);

    [[nodiscard]] auto shortest_unique_prefix_len(std::string_view hex) const -> size_t override;

    [[nodiscard]] auto size() const -> size_t {
        return ids_.size();
    }

private:
    std::vector<std::string> ids_;
};

// ============================================================================
// Ids
// ============================================================================

/// Result of `CommitOrChangeId::shortest()`.
struct ShortestIdPrefix {
    std::string prefix;
    std::string rest;

    /// `prefix[rest]`, or just `prefix` when `rest` is empty.
    [[nodiscard]] auto with_brackets() const -> std::string;

    [[nodiscard]] auto operator==(const ShortestIdPrefix& other) const -> bool = default;
};

/// A commit id or change id in hex form.
class CommitOrChangeId {
public:
    /// An id without an index; its shortest unique prefix is the whole id.
    explicit CommitOrChangeId(std::string hex);

    CommitOrChangeId(std::string hex, Rc<const IdIndex> index);

    [[nodiscard]] auto hex() const -> const std::string& {
        return hex_;
    }

    /// The first `min(len, hex().size())` digits.
    [[nodiscard]] auto short_hex(size_t len) const -> std::string;

    /// The shortest unambiguous prefix, padded with `rest` to at least
    /// `total_len` digits.
    [[nodiscard]] auto shortest(size_t total_len) const -> ShortestIdPrefix;

private:
    std::string hex_;
    Rc<const IdIndex> index_;
};

// ============================================================================
// Signature and Timestamp
// ============================================================================

/// A point in time with the UTC offset it was recorded in.
struct Timestamp {
    int64_t millis_since_epoch = 0;
    int32_t tz_offset = 0; ///< Minutes east of UTC

    [[nodiscard]] auto operator==(const Timestamp& other) const -> bool = default;
};

/// Author or committer of a commit.
struct Signature {
    std::string name;
    std::string email;
    Timestamp timestamp;

    /// The part of the email before the first `@`, or the whole email.
    [[nodiscard]] auto username() const -> std::string;

    [[nodiscard]] auto operator==(const Signature& other) const -> bool = default;
};

} // namespace stencil::types

#endif // STENCIL_TYPES_VALUE_TYPES_HPP
