#include "hashtree/cid_utils.hpp"
#include "hashtree/hasher.hpp"
#include "hashtree/merkle_tree.hpp"
#include "mocks/mock_hasher.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hashtree;
using ::testing::_;

class MerkleTreeTest : public ::testing::Test {
protected:
  Blake3Hasher hasher;
  TreeBuilder builder{hasher};

  Digest h(const std::string &s) const { return hasher.hash(s); }
  Digest pair(const Digest &l, const Digest &r) const {
    return hasher.hashPair(l, r);
  }

  static std::vector<std::string> numbered(size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < n; ++i)
      out.push_back("block-" + std::to_string(i));
    return out;
  }
};

TEST_F(MerkleTreeTest, EmptyInputHasNoRoot) {
  MerkleTree tree = builder.build(std::vector<Block>{});
  EXPECT_FALSE(tree.hasRoot());
  EXPECT_EQ(tree.root(), nullptr);
  EXPECT_EQ(tree.rootDigest(), EMPTY_ROOT);
  EXPECT_EQ(tree.leafCount(), 0u);
  EXPECT_EQ(tree.height(), 0u);
  EXPECT_EQ(tree.nodeCount(), 0u);
  EXPECT_TRUE(tree.verify(hasher));
  EXPECT_EQ(builder.computeRoot({}), EMPTY_ROOT);
}

TEST_F(MerkleTreeTest, SingleBlockRootIsLeafDigest) {
  MerkleTree tree = builder.buildFromStrings({"only"});
  ASSERT_TRUE(tree.hasRoot());
  ASSERT_NE(tree.root(), nullptr);
  EXPECT_TRUE(tree.root()->isLeaf());
  EXPECT_EQ(tree.rootDigest(), h("only"));
  EXPECT_EQ(tree.leafCount(), 1u);
  EXPECT_EQ(tree.height(), 0u);
  EXPECT_EQ(tree.nodeCount(), 1u);
  EXPECT_EQ(tree.paddingCount(), 0u);
}

TEST_F(MerkleTreeTest, OddLevelDuplicatesLastLeaf) {
  MerkleTree tree = builder.buildFromStrings({"a", "b", "c"});
  Digest expected = pair(pair(h("a"), h("b")), pair(h("c"), h("c")));
  EXPECT_EQ(tree.rootDigest(), expected);
  EXPECT_EQ(tree.leafCount(), 3u);
  EXPECT_EQ(tree.paddingCount(), 1u);
  EXPECT_EQ(tree.height(), 2u);
  EXPECT_EQ(tree.nodeCount(), 7u);
}

TEST_F(MerkleTreeTest, TransactionScenario) {
  MerkleTree tree = builder.buildFromStrings({"Tx1", "Tx2", "Tx3"});

  Digest h1 = hasher.hash(tree.leaves()[0]);
  Digest h2 = hasher.hash(tree.leaves()[1]);
  Digest h3 = hasher.hash(tree.leaves()[2]);
  EXPECT_EQ(h1, h("Tx1"));
  Digest expected = pair(pair(h1, h2), pair(h3, h3));
  EXPECT_EQ(tree.rootDigest(), expected);
  EXPECT_EQ(tree.rootHex(), digestToHex(expected));
}

TEST_F(MerkleTreeTest, EvenInputNeedsNoPadding) {
  MerkleTree tree = builder.buildFromStrings({"A", "B", "C", "D"});
  Digest expected = pair(pair(h("A"), h("B")), pair(h("C"), h("D")));
  EXPECT_EQ(tree.rootDigest(), expected);
  EXPECT_EQ(tree.paddingCount(), 0u);
  EXPECT_EQ(tree.nodeCount(), 7u);
  EXPECT_FALSE(tree.isMutated());
}

TEST_F(MerkleTreeTest, Deterministic) {
  for (size_t n : {1u, 2u, 5u, 16u, 33u}) {
    auto blocks = numbered(n);
    EXPECT_EQ(builder.buildFromStrings(blocks).rootDigest(),
              builder.buildFromStrings(blocks).rootDigest())
        << "n=" << n;
  }
}

TEST_F(MerkleTreeTest, OrderSensitive) {
  auto blocks = numbered(7);
  Digest original = builder.buildFromStrings(blocks).rootDigest();

  auto reversed = blocks;
  std::reverse(reversed.begin(), reversed.end());
  EXPECT_NE(builder.buildFromStrings(reversed).rootDigest(), original);

  auto swapped = blocks;
  std::swap(swapped[0], swapped[1]);
  EXPECT_NE(builder.buildFromStrings(swapped).rootDigest(), original);

  auto swappedTail = blocks;
  std::swap(swappedTail[5], swappedTail[6]);
  EXPECT_NE(builder.buildFromStrings(swappedTail).rootDigest(), original);
}

TEST_F(MerkleTreeTest, DuplicatedSequenceDiffersFromOriginal) {
  for (size_t n : {1u, 2u, 3u, 4u, 7u}) {
    auto blocks = numbered(n);
    auto doubled = blocks;
    doubled.insert(doubled.end(), blocks.begin(), blocks.end());
    MerkleTree single = builder.buildFromStrings(blocks);
    MerkleTree twice = builder.buildFromStrings(doubled);
    EXPECT_NE(single.rootDigest(), twice.rootDigest()) << "n=" << n;
    EXPECT_EQ(twice.leafCount(), 2 * n);
  }
}

TEST_F(MerkleTreeTest, LeavesPreserveInputOrder) {
  auto blocks = numbered(5);
  MerkleTree tree = builder.buildFromStrings(blocks);
  ASSERT_EQ(tree.leaves().size(), blocks.size());
  for (size_t i = 0; i < blocks.size(); ++i) {
    EXPECT_EQ(tree.leaves()[i], toBlock(blocks[i]));
  }
}

TEST_F(MerkleTreeTest, PaddedSubtreeVisibleInShape) {
  MerkleTree tree = builder.buildFromStrings({"a", "b", "c", "d", "e"});
  const MerkleNode *root = tree.root();
  ASSERT_NE(root, nullptr);

  // Level 0 pads "e", level 1 pads hash(e ++ e).
  EXPECT_EQ(tree.paddingCount(), 2u);
  EXPECT_EQ(tree.height(), 3u);
  EXPECT_EQ(root->height(), 3u);
  EXPECT_EQ(tree.nodeCount(), 15u);
  EXPECT_EQ(root->subtreeSize(), 15u);

  const MerkleNode *right = root->right();
  ASSERT_NE(right, nullptr);
  ASSERT_FALSE(right->isLeaf());
  EXPECT_NE(right->left(), right->right());
  EXPECT_EQ(right->left()->digest(), right->right()->digest());
  EXPECT_EQ(right->left()->digest(), pair(h("e"), h("e")));
  EXPECT_EQ(right->right()->left()->digest(), h("e"));
  EXPECT_EQ(right->right()->right()->digest(), h("e"));
}

TEST_F(MerkleTreeTest, EveryInternalNodeHasTwoChildren) {
  MerkleTree tree = builder.buildFromStrings(numbered(11));
  std::vector<const MerkleNode *> stack{tree.root()};
  size_t visited = 0;
  while (!stack.empty()) {
    const MerkleNode *node = stack.back();
    stack.pop_back();
    ++visited;
    if (node->isLeaf()) {
      EXPECT_EQ(node->left(), nullptr);
      EXPECT_EQ(node->right(), nullptr);
      continue;
    }
    ASSERT_NE(node->left(), nullptr);
    ASSERT_NE(node->right(), nullptr);
    EXPECT_EQ(node->digest(),
              pair(node->left()->digest(), node->right()->digest()));
    stack.push_back(node->left());
    stack.push_back(node->right());
  }
  EXPECT_EQ(visited, tree.nodeCount());
}

TEST_F(MerkleTreeTest, HeightIsCeilLog2OfLeafCount) {
  for (size_t n = 1; n <= 33; ++n) {
    MerkleTree tree = builder.buildFromStrings(numbered(n));
    size_t expected = 0;
    while ((size_t{1} << expected) < n)
      ++expected;
    EXPECT_EQ(tree.height(), expected) << "n=" << n;
  }
}

TEST_F(MerkleTreeTest, RootOnlyMatchesRetainedStructure) {
  TreeBuilder rootOnly(hasher, BuildOptions{false});
  for (size_t n = 0; n <= 17; ++n) {
    auto blocks = numbered(n);
    MerkleTree full = builder.buildFromStrings(blocks);
    MerkleTree slim = rootOnly.buildFromStrings(blocks);

    EXPECT_EQ(slim.root(), nullptr);
    EXPECT_EQ(slim.hasRoot(), n > 0);
    EXPECT_EQ(slim.rootDigest(), full.rootDigest()) << "n=" << n;
    EXPECT_EQ(slim.height(), full.height());
    EXPECT_EQ(slim.nodeCount(), full.nodeCount());
    EXPECT_EQ(slim.paddingCount(), full.paddingCount());
    EXPECT_EQ(slim.leafCount(), n);
    EXPECT_EQ(builder.computeRoot(slim.leaves()), full.rootDigest());
    EXPECT_TRUE(slim.verify(hasher));
  }
}

TEST_F(MerkleTreeTest, MutationFlagsDuplicatedTail) {
  MerkleTree honest = builder.buildFromStrings({"a", "b", "c"});
  MerkleTree padded = builder.buildFromStrings({"a", "b", "c", "c"});
  EXPECT_FALSE(honest.isMutated());
  EXPECT_TRUE(padded.isMutated());
  // The reason the flag exists: both lists commit to the same root.
  EXPECT_EQ(honest.rootDigest(), padded.rootDigest());

  EXPECT_TRUE(builder.buildFromStrings({"x", "x"}).isMutated());
  EXPECT_FALSE(builder.buildFromStrings({"x", "y", "x"}).isMutated());
}

TEST_F(MerkleTreeTest, VerifyRequiresMatchingHasher) {
  Sha256Hasher sha;
  TreeBuilder shaBuilder(sha);
  MerkleTree tree = shaBuilder.buildFromStrings({"a", "b", "c"});
  EXPECT_EQ(tree.algorithm(), HashAlgorithm::SHA256);
  EXPECT_TRUE(tree.verify(sha));
  EXPECT_FALSE(tree.verify(hasher));
}

TEST_F(MerkleTreeTest, VerifyRootDetectsTamperedBlock) {
  std::vector<Block> blocks{toBlock("one"), toBlock("two"), toBlock("three")};
  Digest root = builder.build(blocks).rootDigest();
  EXPECT_TRUE(verifyRoot(hasher, blocks, root));

  blocks[1].push_back(std::byte{'!'});
  EXPECT_FALSE(verifyRoot(hasher, blocks, root));
  EXPECT_TRUE(verifyRoot(hasher, {}, EMPTY_ROOT));
}

TEST_F(MerkleTreeTest, RootCidCarriesAlgorithm) {
  MerkleTree tree = builder.buildFromStrings({"a", "b"});
  HashAlgorithm algo = HashAlgorithm::SHA256;
  EXPECT_EQ(cidToDigest(tree.rootCid(), &algo), tree.rootDigest());
  EXPECT_EQ(algo, HashAlgorithm::BLAKE3);
}

TEST_F(MerkleTreeTest, TreeIsMovable) {
  MerkleTree tree = builder.buildFromStrings({"a", "b", "c"});
  Digest root = tree.rootDigest();
  MerkleTree moved = std::move(tree);
  EXPECT_EQ(moved.rootDigest(), root);
  EXPECT_EQ(moved.leafCount(), 3u);
  ASSERT_NE(moved.root(), nullptr);
  EXPECT_EQ(moved.root()->digest(), root);
}

TEST(MerkleTreeSha256, ScenarioMatchesManualComputation) {
  Sha256Hasher sha;
  TreeBuilder builder(sha);
  MerkleTree tree = builder.buildFromStrings({"A", "B", "C", "D"});
  Digest expected =
      sha.hashPair(sha.hashPair(sha.hash(std::string("A")),
                                sha.hash(std::string("B"))),
                   sha.hashPair(sha.hash(std::string("C")),
                                sha.hash(std::string("D"))));
  EXPECT_EQ(tree.rootDigest(), expected);
}

TEST(MerkleTreeHasherCalls, PaddingIsNotRehashed) {
  MockHasher mock;
  // 3 leaves, 2 nodes on level 1, 1 root. The padded copy costs nothing.
  EXPECT_CALL(mock, hash(_, _)).Times(6);
  EXPECT_CALL(mock, algorithm()).Times(::testing::AnyNumber());
  TreeBuilder builder(mock);
  MerkleTree tree = builder.buildFromStrings({"a", "b", "c"});
  EXPECT_EQ(tree.paddingCount(), 1u);
}

TEST(MerkleTreeHasherCalls, RootOnlyUsesSameNumberOfCalls) {
  MockHasher mock;
  EXPECT_CALL(mock, hash(_, _)).Times(5 + 3 + 2 + 1);
  EXPECT_CALL(mock, algorithm()).Times(::testing::AnyNumber());
  TreeBuilder builder(mock, BuildOptions{false});
  MerkleTree tree = builder.buildFromStrings({"a", "b", "c", "d", "e"});
  EXPECT_EQ(tree.leafCount(), 5u);
}

TEST(MerkleTreeHasherCalls, EmptyInputNeverHashes) {
  MockHasher mock;
  EXPECT_CALL(mock, hash(_, _)).Times(0);
  EXPECT_CALL(mock, algorithm()).Times(::testing::AnyNumber());
  TreeBuilder builder(mock);
  EXPECT_FALSE(builder.build(std::vector<Block>{}).hasRoot());
}

TEST(MerkleTreeHasherCalls, HasherFailureAbortsBuild) {
  for (bool retain : {true, false}) {
    MockHasher mock;
    Blake3Hasher real;
    EXPECT_CALL(mock, hash(_, _))
        .WillOnce([&real](const std::byte *d, size_t n) {
          return real.hash(d, n);
        })
        .WillOnce([&real](const std::byte *d, size_t n) {
          return real.hash(d, n);
        })
        .WillOnce(::testing::Throw(std::runtime_error("hash backend down")));
    EXPECT_CALL(mock, algorithm()).Times(::testing::AnyNumber());

    TreeBuilder builder(mock, BuildOptions{retain});
    EXPECT_THROW(builder.buildFromStrings({"a", "b", "c", "d"}),
                 std::runtime_error);
  }
}
