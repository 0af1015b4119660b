#include "hashtree/hasher.hpp"

#include "blake3.h"
#include <cstring>
#include <sodium.h>
#include <stdexcept>

namespace hashtree {

Digest Hasher::hashPair(const Digest &left, const Digest &right) const {
  std::array<std::byte, DIGEST_SIZE * 2> buf;
  std::memcpy(buf.data(), left.data(), DIGEST_SIZE);
  std::memcpy(buf.data() + DIGEST_SIZE, right.data(), DIGEST_SIZE);
  return hash(buf.data(), buf.size());
}

Sha256Hasher::Sha256Hasher() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

Digest Sha256Hasher::hash(const std::byte *data, size_t size) const {
  static_assert(crypto_hash_sha256_BYTES == DIGEST_SIZE,
                "SHA-256 output must match DIGEST_SIZE");
  Digest digest;
  crypto_hash_sha256(digest.data(),
                     reinterpret_cast<const unsigned char *>(data), size);
  return digest;
}

Digest Blake3Hasher::hash(const std::byte *data, size_t size) const {
  Digest digest;
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  if (data && size > 0) {
    blake3_hasher_update(&hasher, reinterpret_cast<const uint8_t *>(data),
                         size);
  }
  blake3_hasher_finalize(&hasher, digest.data(), DIGEST_SIZE);
  return digest;
}

std::unique_ptr<Hasher> makeHasher(HashAlgorithm algo) {
  if (algo == HashAlgorithm::SHA256) {
    return std::make_unique<Sha256Hasher>();
  }
  return std::make_unique<Blake3Hasher>();
}

} // namespace hashtree
