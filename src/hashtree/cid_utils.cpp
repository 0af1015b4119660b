#include "hashtree/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace hashtree {

static const std::array<uint8_t, 4> &prefixFor(HashAlgorithm algo) {
  return algo == HashAlgorithm::SHA256 ? CID_PREFIX_SHA256 : CID_PREFIX_BLAKE3;
}

std::string digestToCid(const Digest &digest, HashAlgorithm algo) {
  const auto &prefix = prefixFor(algo);
  std::vector<uint8_t> bytes;
  bytes.reserve(prefix.size() + digest.size());
  bytes.insert(bytes.end(), prefix.begin(), prefix.end());
  bytes.insert(bytes.end(), digest.begin(), digest.end());
  return cppcodec::base32_rfc4648::encode(bytes);
}

Digest cidToDigest(const std::string &cid, HashAlgorithm *algoOut) {
  if (cid.empty()) {
    throw std::runtime_error("CID string cannot be empty.");
  }

  std::vector<uint8_t> decoded;
  try {
    decoded = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode Base32 CID: " +
                             std::string(e.what()));
  }

  if (decoded.size() < CID_PREFIX_BLAKE3.size()) {
    throw std::runtime_error(
        "Invalid CID: Decoded data too short to contain prefix.");
  }

  HashAlgorithm algo;
  if (std::equal(CID_PREFIX_SHA256.begin(), CID_PREFIX_SHA256.end(),
                 decoded.begin())) {
    algo = HashAlgorithm::SHA256;
  } else if (std::equal(CID_PREFIX_BLAKE3.begin(), CID_PREFIX_BLAKE3.end(),
                        decoded.begin())) {
    algo = HashAlgorithm::BLAKE3;
  } else {
    throw std::runtime_error("Invalid CID: Prefix mismatch.");
  }

  const size_t prefixSize = prefixFor(algo).size();
  if (decoded.size() != prefixSize + DIGEST_SIZE) {
    throw std::runtime_error("Invalid CID: Decoded data length does not match "
                             "expected digest size.");
  }

  Digest digest;
  std::copy(decoded.begin() + prefixSize, decoded.end(), digest.begin());
  if (algoOut) {
    *algoOut = algo;
  }
  return digest;
}

Digest parseDigest(const std::string &text, HashAlgorithm *algoOut) {
  if (text.size() == DIGEST_SIZE * 2 &&
      std::all_of(text.begin(), text.end(),
                  [](unsigned char c) { return std::isxdigit(c) != 0; })) {
    return hexToDigest(text);
  }
  return cidToDigest(text, algoOut);
}

} // namespace hashtree
