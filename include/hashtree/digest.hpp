#ifndef HASHTREE_DIGEST_HPP
#define HASHTREE_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hashtree {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/// An opaque input block.
using Block = std::vector<std::byte>;

/// Root digest reported by a tree built from an empty block list.
inline constexpr Digest EMPTY_ROOT{};

/**
 * @brief Lower-case hex rendering of a digest (64 characters).
 */
std::string digestToHex(const Digest &digest);

/**
 * @brief Parse a 64 character hex string back into a digest.
 * @throws std::runtime_error if the string has the wrong length or contains
 *         non-hex characters.
 */
Digest hexToDigest(const std::string &hex);

/** Canonical name used in config files and on the command line. */
std::string algorithmName(HashAlgorithm algo);

/**
 * @brief Parse an algorithm name ("sha256" or "blake3", case-insensitive).
 * @throws std::runtime_error for an unknown name.
 */
HashAlgorithm parseAlgorithm(const std::string &name);

/** Convert text to a block, byte for byte. */
Block toBlock(const std::string &text);

} // namespace hashtree

#endif // HASHTREE_DIGEST_HPP
