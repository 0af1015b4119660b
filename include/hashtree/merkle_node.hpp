#ifndef HASHTREE_MERKLE_NODE_HPP
#define HASHTREE_MERKLE_NODE_HPP

#include "hashtree/digest.hpp"
#include "hashtree/hasher.hpp"

#include <cstddef>
#include <memory>
#include <span>

namespace hashtree {

/**
 * @brief A node of a binary hash tree.
 *
 * A Leaf carries hash(block) and has no children. An Internal node carries
 * hash(left.digest ++ right.digest) and exclusively owns both children.
 * Nodes are only created through the factory functions, which makes a node
 * with a single child unrepresentable. The digest never changes after
 * construction.
 */
class MerkleNode {
public:
  enum class Kind { Leaf, Internal };

  /// Hash @p block and wrap the digest in a Leaf.
  static std::unique_ptr<MerkleNode> makeLeaf(const Hasher &hasher,
                                              std::span<const std::byte> block);

  /// Leaf for an already computed digest.
  static std::unique_ptr<MerkleNode> makeLeaf(const Digest &digest);

  /**
   * @brief Combine two subtrees under a new Internal node.
   * @throw std::logic_error If either child is null.
   */
  static std::unique_ptr<MerkleNode>
  makeInternal(const Hasher &hasher, std::unique_ptr<MerkleNode> left,
               std::unique_ptr<MerkleNode> right);

  MerkleNode(const MerkleNode &) = delete;
  MerkleNode &operator=(const MerkleNode &) = delete;

  /// Deep structural copy. Digests are copied, never recomputed.
  std::unique_ptr<MerkleNode> clone() const;

  Kind kind() const { return kind_; }
  bool isLeaf() const { return kind_ == Kind::Leaf; }
  const Digest &digest() const { return digest_; }

  /// Children of an Internal node; nullptr for a Leaf.
  const MerkleNode *left() const { return left_.get(); }
  const MerkleNode *right() const { return right_.get(); }

  /// Number of nodes in this subtree, this node included.
  size_t subtreeSize() const;

  /// Edges on the longest path down to a leaf (0 for a Leaf).
  size_t height() const;

private:
  MerkleNode(Kind kind, const Digest &digest, std::unique_ptr<MerkleNode> left,
             std::unique_ptr<MerkleNode> right);

  Kind kind_;
  Digest digest_;
  std::unique_ptr<MerkleNode> left_;
  std::unique_ptr<MerkleNode> right_;
};

} // namespace hashtree

#endif // HASHTREE_MERKLE_NODE_HPP
