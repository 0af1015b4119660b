#ifndef HASHTREE_MERKLE_TREE_HPP
#define HASHTREE_MERKLE_TREE_HPP

#include "hashtree/digest.hpp"
#include "hashtree/hasher.hpp"
#include "hashtree/merkle_node.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hashtree {

struct BuildOptions {
  /// Keep the node structure. When false only the root digest is kept.
  bool retainNodes{true};
};

/**
 * @brief Immutable result of a tree build.
 *
 * Holds the original blocks in input order, the root digest and, when the
 * builder retained it, the node structure. A tree built from no blocks has
 * no root and reports EMPTY_ROOT as its root digest.
 */
class MerkleTree {
public:
  MerkleTree(MerkleTree &&) noexcept = default;
  MerkleTree &operator=(MerkleTree &&) noexcept = default;
  MerkleTree(const MerkleTree &) = delete;
  MerkleTree &operator=(const MerkleTree &) = delete;

  /// Root digest, or EMPTY_ROOT when the tree has no root.
  Digest rootDigest() const;
  std::string rootHex() const;
  std::string rootCid() const;

  bool hasRoot() const { return rootDigest_.has_value(); }

  /// Root node; nullptr for an empty tree or when nodes were not retained.
  const MerkleNode *root() const { return root_.get(); }

  const std::vector<Block> &leaves() const { return leaves_; }

  /// Number of original blocks. Parity padding is not counted.
  size_t leafCount() const { return leaves_.size(); }

  HashAlgorithm algorithm() const { return algorithm_; }

  /// Number of reduction levels above the leaves.
  size_t height() const { return height_; }

  /// Nodes in the full tree, duplicated parity subtrees included.
  size_t nodeCount() const { return nodeCount_; }

  /// Number of times a level was padded by duplicating its last node.
  size_t paddingCount() const { return paddingCount_; }

  /**
   * @brief True if some level paired two identical digests.
   *
   * Such a block list has the same root as a different list that differs
   * only by a duplicated tail (e.g. [a,b,c] and [a,b,c,c]).
   */
  bool isMutated() const { return mutated_; }

  /// Recompute the root from the retained leaves and compare.
  bool verify(const Hasher &hasher) const;

private:
  friend class TreeBuilder;
  MerkleTree(std::vector<Block> leaves, HashAlgorithm algorithm);

  std::vector<Block> leaves_;
  std::optional<Digest> rootDigest_;
  std::unique_ptr<MerkleNode> root_;
  HashAlgorithm algorithm_;
  size_t height_{0};
  size_t nodeCount_{0};
  size_t paddingCount_{0};
  bool mutated_{false};
};

/**
 * @brief Builds a MerkleTree by bottom-up pairwise reduction.
 *
 * Every block becomes a leaf. While a level holds more than one node, an odd
 * level is padded with a copy of its last node, then consecutive pairs are
 * combined under new Internal nodes. The hasher must outlive the builder.
 */
class TreeBuilder {
public:
  explicit TreeBuilder(const Hasher &hasher, BuildOptions options = {});

  /**
   * @brief Build a tree over @p blocks, preserving their order.
   *
   * Never fails on its own; an exception thrown by the hasher propagates
   * and no tree is produced.
   */
  MerkleTree build(std::vector<Block> blocks) const;

  /// build() over the bytes of each string.
  MerkleTree buildFromStrings(const std::vector<std::string> &blocks) const;

  /// Root digest only, without allocating nodes. EMPTY_ROOT for no blocks.
  Digest computeRoot(const std::vector<Block> &blocks) const;

  const Hasher &hasher() const { return hasher_; }
  const BuildOptions &options() const { return options_; }

private:
  struct Reduction {
    std::optional<Digest> root;
    std::unique_ptr<MerkleNode> node;
    size_t height{0};
    size_t nodeCount{0};
    size_t paddingCount{0};
    bool mutated{false};
  };

  Reduction reduceNodes(const std::vector<Block> &blocks) const;
  Reduction reduceDigests(const std::vector<Block> &blocks) const;

  const Hasher &hasher_;
  BuildOptions options_;
};

/// True if @p blocks reduce to @p expected under @p hasher.
bool verifyRoot(const Hasher &hasher, const std::vector<Block> &blocks,
                const Digest &expected);

} // namespace hashtree

#endif // HASHTREE_MERKLE_TREE_HPP
