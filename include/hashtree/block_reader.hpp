#ifndef HASHTREE_BLOCK_READER_HPP
#define HASHTREE_BLOCK_READER_HPP

#include "hashtree/digest.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hashtree {

/**
 * @brief Split @p data into consecutive blocks of @p blockSize bytes.
 *
 * The last block may be shorter. Empty input yields no blocks.
 * @throws std::invalid_argument if @p blockSize is zero.
 */
std::vector<Block> splitBlocks(const std::vector<std::byte> &data,
                               size_t blockSize);

/**
 * @brief Read a file as blocks.
 *
 * With @p blockSize 0 the whole file is a single block, even when empty.
 * Otherwise the contents are split with splitBlocks().
 * @throws std::runtime_error if the file cannot be opened or read.
 */
std::vector<Block> readBlocks(const std::string &path, size_t blockSize = 0);

/// readBlocks() over several files, concatenating their blocks in order.
std::vector<Block> readBlocksFromFiles(const std::vector<std::string> &paths,
                                       size_t blockSize = 0);

} // namespace hashtree

#endif // HASHTREE_BLOCK_READER_HPP
