#include "hashtree/merkle_tree.hpp"
#include "hashtree/cid_utils.hpp"
#include "hashtree/logger.h"

#include <stdexcept>
#include <utility>

namespace hashtree {

MerkleTree::MerkleTree(std::vector<Block> leaves, HashAlgorithm algorithm)
    : leaves_(std::move(leaves)), algorithm_(algorithm) {}

Digest MerkleTree::rootDigest() const {
  return rootDigest_ ? *rootDigest_ : EMPTY_ROOT;
}

std::string MerkleTree::rootHex() const { return digestToHex(rootDigest()); }

std::string MerkleTree::rootCid() const {
  return digestToCid(rootDigest(), algorithm_);
}

bool MerkleTree::verify(const Hasher &hasher) const {
  if (!hasRoot())
    return leaves_.empty();
  if (root_ && root_->digest() != *rootDigest_)
    return false;
  return verifyRoot(hasher, leaves_, *rootDigest_);
}

TreeBuilder::TreeBuilder(const Hasher &hasher, BuildOptions options)
    : hasher_(hasher), options_(options) {}

TreeBuilder::Reduction
TreeBuilder::reduceNodes(const std::vector<Block> &blocks) const {
  Reduction result;
  if (blocks.empty())
    return result;

  std::vector<std::unique_ptr<MerkleNode>> level;
  level.reserve(blocks.size());
  for (const auto &block : blocks) {
    level.push_back(MerkleNode::makeLeaf(hasher_, block));
  }
  result.nodeCount = level.size();

  while (level.size() > 1) {
    for (size_t pos = 0; pos + 1 < level.size(); pos += 2) {
      if (level[pos]->digest() == level[pos + 1]->digest())
        result.mutated = true;
    }
    if (level.size() % 2 != 0) {
      auto copy = level.back()->clone();
      result.nodeCount += copy->subtreeSize();
      level.push_back(std::move(copy));
      ++result.paddingCount;
    }

    std::vector<std::unique_ptr<MerkleNode>> next;
    next.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      next.push_back(MerkleNode::makeInternal(hasher_, std::move(level[i]),
                                              std::move(level[i + 1])));
    }
    ++result.height;
    result.nodeCount += next.size();
    if (Logger::getInstance().isEnabled(LogLevel::TRACE)) {
      Logger::trace("Level %zu reduced %zu nodes to %zu", result.height,
                    level.size(), next.size());
    }
    level = std::move(next);
  }

  result.root = level.front()->digest();
  result.node = std::move(level.front());
  return result;
}

// Same reduction as reduceNodes() over bare digests. sizes[i] tracks the
// node count of the subtree behind level[i] so padding is accounted for.
TreeBuilder::Reduction
TreeBuilder::reduceDigests(const std::vector<Block> &blocks) const {
  Reduction result;
  if (blocks.empty())
    return result;

  std::vector<Digest> level;
  level.reserve(blocks.size());
  for (const auto &block : blocks) {
    level.push_back(hasher_.hash(block));
  }
  std::vector<size_t> sizes(level.size(), 1);
  result.nodeCount = level.size();

  while (level.size() > 1) {
    for (size_t pos = 0; pos + 1 < level.size(); pos += 2) {
      if (level[pos] == level[pos + 1])
        result.mutated = true;
    }
    if (level.size() % 2 != 0) {
      level.push_back(level.back());
      sizes.push_back(sizes.back());
      result.nodeCount += sizes.back();
      ++result.paddingCount;
    }

    std::vector<Digest> next;
    std::vector<size_t> nextSizes;
    next.reserve(level.size() / 2);
    nextSizes.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      next.push_back(hasher_.hashPair(level[i], level[i + 1]));
      nextSizes.push_back(1 + sizes[i] + sizes[i + 1]);
    }
    ++result.height;
    result.nodeCount += next.size();
    level = std::move(next);
    sizes = std::move(nextSizes);
  }

  result.root = level.front();
  return result;
}

MerkleTree TreeBuilder::build(std::vector<Block> blocks) const {
  Reduction reduction;
  try {
    reduction =
        options_.retainNodes ? reduceNodes(blocks) : reduceDigests(blocks);
  } catch (const std::exception &e) {
    Logger::getInstance().log(
        LogLevel::ERROR,
        "Tree build over " + std::to_string(blocks.size()) +
            " blocks aborted by hasher failure: " + e.what());
    throw;
  }

  MerkleTree tree(std::move(blocks), hasher_.algorithm());
  tree.rootDigest_ = reduction.root;
  tree.root_ = std::move(reduction.node);
  tree.height_ = reduction.height;
  tree.nodeCount_ = reduction.nodeCount;
  tree.paddingCount_ = reduction.paddingCount;
  tree.mutated_ = reduction.mutated;

  if (Logger::getInstance().isEnabled(LogLevel::DEBUG)) {
    Logger::getInstance().log(
        LogLevel::DEBUG,
        "Built " + algorithmName(tree.algorithm_) + " tree: leaves=" +
            std::to_string(tree.leafCount()) +
            " height=" + std::to_string(tree.height_) +
            " padding=" + std::to_string(tree.paddingCount_) +
            " root=" + tree.rootHex());
  }
  if (tree.mutated_) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Tree over " + std::to_string(tree.leafCount()) +
                                  " blocks pairs identical digests");
  }
  return tree;
}

MerkleTree
TreeBuilder::buildFromStrings(const std::vector<std::string> &blocks) const {
  std::vector<Block> converted;
  converted.reserve(blocks.size());
  for (const auto &text : blocks) {
    converted.push_back(toBlock(text));
  }
  return build(std::move(converted));
}

Digest TreeBuilder::computeRoot(const std::vector<Block> &blocks) const {
  Reduction reduction = reduceDigests(blocks);
  return reduction.root ? *reduction.root : EMPTY_ROOT;
}

bool verifyRoot(const Hasher &hasher, const std::vector<Block> &blocks,
                const Digest &expected) {
  TreeBuilder builder(hasher, BuildOptions{false});
  return builder.computeRoot(blocks) == expected;
}

} // namespace hashtree
