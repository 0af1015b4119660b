#include "hashtree/merkle_node.hpp"

#include <algorithm>
#include <stdexcept>

namespace hashtree {

MerkleNode::MerkleNode(Kind kind, const Digest &digest,
                       std::unique_ptr<MerkleNode> left,
                       std::unique_ptr<MerkleNode> right)
    : kind_(kind), digest_(digest), left_(std::move(left)),
      right_(std::move(right)) {}

std::unique_ptr<MerkleNode>
MerkleNode::makeLeaf(const Hasher &hasher, std::span<const std::byte> block) {
  return makeLeaf(hasher.hash(block));
}

std::unique_ptr<MerkleNode> MerkleNode::makeLeaf(const Digest &digest) {
  return std::unique_ptr<MerkleNode>(
      new MerkleNode(Kind::Leaf, digest, nullptr, nullptr));
}

std::unique_ptr<MerkleNode>
MerkleNode::makeInternal(const Hasher &hasher, std::unique_ptr<MerkleNode> left,
                         std::unique_ptr<MerkleNode> right) {
  if (!left || !right) {
    throw std::logic_error("Internal node requires two children");
  }
  Digest digest = hasher.hashPair(left->digest(), right->digest());
  return std::unique_ptr<MerkleNode>(new MerkleNode(
      Kind::Internal, digest, std::move(left), std::move(right)));
}

std::unique_ptr<MerkleNode> MerkleNode::clone() const {
  if (isLeaf()) {
    return makeLeaf(digest_);
  }
  return std::unique_ptr<MerkleNode>(new MerkleNode(
      Kind::Internal, digest_, left_->clone(), right_->clone()));
}

size_t MerkleNode::subtreeSize() const {
  if (isLeaf())
    return 1;
  return 1 + left_->subtreeSize() + right_->subtreeSize();
}

size_t MerkleNode::height() const {
  if (isLeaf())
    return 0;
  return 1 + std::max(left_->height(), right_->height());
}

} // namespace hashtree
