#ifndef HASHTREE_HASHER_HPP
#define HASHTREE_HASHER_HPP

#include "hashtree/digest.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string>

namespace hashtree {

/**
 * @brief Hash function injected into the tree builder.
 *
 * Implementations must be deterministic and free of observable side effects.
 * A failing implementation reports the failure by throwing; the builder does
 * not catch it.
 */
class Hasher {
public:
  virtual ~Hasher() = default;

  /// Hash @p size bytes starting at @p data.
  virtual Digest hash(const std::byte *data, size_t size) const = 0;

  /// Algorithm identifier used when rendering digests as CIDs.
  virtual HashAlgorithm algorithm() const = 0;

  Digest hash(std::span<const std::byte> bytes) const {
    return hash(bytes.data(), bytes.size());
  }

  Digest hash(const std::string &text) const {
    return hash(reinterpret_cast<const std::byte *>(text.data()), text.size());
  }

  /**
   * @brief Hash of the 64 byte concatenation @p left ++ @p right.
   *
   * Digests are concatenated in their fixed-width binary form.
   */
  Digest hashPair(const Digest &left, const Digest &right) const;
};

/** SHA-256 backed by libsodium. */
class Sha256Hasher : public Hasher {
public:
  /// @throw std::runtime_error If libsodium cannot be initialised.
  Sha256Hasher();

  Digest hash(const std::byte *data, size_t size) const override;
  HashAlgorithm algorithm() const override { return HashAlgorithm::SHA256; }
  using Hasher::hash;
};

/** BLAKE3 backed by the reference C implementation. */
class Blake3Hasher : public Hasher {
public:
  Digest hash(const std::byte *data, size_t size) const override;
  HashAlgorithm algorithm() const override { return HashAlgorithm::BLAKE3; }
  using Hasher::hash;
};

/// Construct the hasher for @p algo.
std::unique_ptr<Hasher> makeHasher(HashAlgorithm algo);

} // namespace hashtree

#endif // HASHTREE_HASHER_HPP
