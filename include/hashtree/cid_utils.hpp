#ifndef HASHTREE_CID_UTILS_HPP
#define HASHTREE_CID_UTILS_HPP

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "hashtree/digest.hpp"

namespace hashtree {

// CIDv1 (0x01), raw codec (0x55), multihash code, digest length (0x20)
inline constexpr std::array<uint8_t, 4> CID_PREFIX_SHA256{0x01, 0x55, 0x12,
                                                          0x20};
inline constexpr std::array<uint8_t, 4> CID_PREFIX_BLAKE3{0x01, 0x55, 0x1e,
                                                          0x20};

/**
 * @brief Converts a digest to a CIDv1 string.
 * @param digest The hash digest.
 * @param algo Algorithm that produced @p digest.
 * @return Base32 (RFC 4648) encoding of prefix ++ digest.
 */
std::string digestToCid(const Digest &digest,
                        HashAlgorithm algo = HashAlgorithm::BLAKE3);

/**
 * @brief Converts a CIDv1 string to its digest.
 * @param cid The CIDv1 string.
 * @param algoOut Receives the algorithm named by the CID prefix.
 * @return The extracted digest.
 * @throws std::runtime_error if the CID is invalid.
 */
Digest cidToDigest(const std::string &cid, HashAlgorithm *algoOut = nullptr);

/**
 * @brief Parse either a CID or a 64 character hex digest.
 *
 * Hex input carries no algorithm; @p algoOut is left untouched for it.
 * @throws std::runtime_error if neither form parses.
 */
Digest parseDigest(const std::string &text, HashAlgorithm *algoOut = nullptr);

} // namespace hashtree

#endif // HASHTREE_CID_UTILS_HPP
