#include "hashtree/block_reader.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace hashtree {

std::vector<Block> splitBlocks(const std::vector<std::byte> &data,
                               size_t blockSize) {
  if (blockSize == 0) {
    throw std::invalid_argument("Block size must be greater than zero");
  }
  std::vector<Block> blocks;
  blocks.reserve((data.size() + blockSize - 1) / blockSize);
  for (size_t offset = 0; offset < data.size(); offset += blockSize) {
    size_t len = std::min(blockSize, data.size() - offset);
    blocks.emplace_back(data.begin() + offset, data.begin() + offset + len);
  }
  return blocks;
}

static std::vector<std::byte> readFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Unable to open input file: " + path);
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("Error while reading input file: " + path);
  }
  std::vector<std::byte> data;
  data.reserve(tmp.size());
  for (char c : tmp)
    data.push_back(std::byte(c));
  return data;
}

std::vector<Block> readBlocks(const std::string &path, size_t blockSize) {
  std::vector<std::byte> data = readFile(path);
  if (blockSize == 0) {
    std::vector<Block> blocks;
    blocks.push_back(std::move(data));
    return blocks;
  }
  return splitBlocks(data, blockSize);
}

std::vector<Block> readBlocksFromFiles(const std::vector<std::string> &paths,
                                       size_t blockSize) {
  std::vector<Block> blocks;
  for (const auto &path : paths) {
    auto fileBlocks = readBlocks(path, blockSize);
    std::move(fileBlocks.begin(), fileBlocks.end(),
              std::back_inserter(blocks));
  }
  return blocks;
}

} // namespace hashtree
