//! # Value Type Tests
//!
//! Id shortening and signature helpers.

#include "types/value_types.hpp"

#include <gtest/gtest.h>

using namespace stencil;
using namespace stencil::types;

class IdIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        index_ = make_rc<SortedIdIndex>(std::vector<std::string>{"abd456", "ff0000", "abc123"});
    }

    Rc<const IdIndex> index_;
};

// ============================================================================
// SortedIdIndex
// ============================================================================

TEST_F(IdIndexTest, PrefixExtendsPastClosestNeighbour) {
    EXPECT_EQ(index_->shortest_unique_prefix_len("abc123"), 3u);
    EXPECT_EQ(index_->shortest_unique_prefix_len("abd456"), 3u);
    EXPECT_EQ(index_->shortest_unique_prefix_len("ff0000"), 1u);
}

TEST_F(IdIndexTest, IdsOutsideTheIndex) {
    EXPECT_EQ(index_->shortest_unique_prefix_len("abe"), 3u);
    EXPECT_EQ(index_->shortest_unique_prefix_len("0000"), 1u);
}

TEST_F(IdIndexTest, PrefixNeverExceedsId) {
    // "ab" is a prefix of two indexed ids.
    EXPECT_EQ(index_->shortest_unique_prefix_len("ab"), 2u);
}

TEST(SortedIdIndexTest, DuplicatesCollapse) {
    SortedIdIndex index({"aa11", "aa11", "bb22"});
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.shortest_unique_prefix_len("aa11"), 1u);
}

TEST(SortedIdIndexTest, EmptyIndex) {
    SortedIdIndex index({});
    EXPECT_EQ(index.shortest_unique_prefix_len("abc"), 1u);
}

// ============================================================================
// CommitOrChangeId
// ============================================================================

TEST_F(IdIndexTest, ShortHex) {
    CommitOrChangeId id("abc123", index_);
    EXPECT_EQ(id.short_hex(0), "");
    EXPECT_EQ(id.short_hex(4), "abc1");
    EXPECT_EQ(id.short_hex(100), "abc123");
}

TEST_F(IdIndexTest, ShortestPadsToTotalLength) {
    CommitOrChangeId id("abc123", index_);
    EXPECT_EQ(id.shortest(0), (ShortestIdPrefix{.prefix = "abc", .rest = ""}));
    EXPECT_EQ(id.shortest(5), (ShortestIdPrefix{.prefix = "abc", .rest = "12"}));
    EXPECT_EQ(id.shortest(50), (ShortestIdPrefix{.prefix = "abc", .rest = "123"}));
}

TEST(CommitOrChangeIdTest, WithoutIndexWholeIdIsThePrefix) {
    CommitOrChangeId id("abc123");
    EXPECT_EQ(id.shortest(2), (ShortestIdPrefix{.prefix = "abc123", .rest = ""}));
}

TEST(ShortestIdPrefixTest, WithBrackets) {
    EXPECT_EQ((ShortestIdPrefix{.prefix = "ab", .rest = "c1"}).with_brackets(), "ab[c1]");
    EXPECT_EQ((ShortestIdPrefix{.prefix = "ab", .rest = ""}).with_brackets(), "ab");
}

// ============================================================================
// Signature
// ============================================================================

TEST(SignatureTest, Username) {
    Signature sig{.name = "Ada", .email = "ada@example.com", .timestamp = {}};
    EXPECT_EQ(sig.username(), "ada");

    sig.email = "no-at-sign";
    EXPECT_EQ(sig.username(), "no-at-sign");

    sig.email = "a@b@c";
    EXPECT_EQ(sig.username(), "a");

    sig.email = "";
    EXPECT_EQ(sig.username(), "");
}
