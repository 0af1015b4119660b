#include "hashtree/digest.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hashtree {

std::string digestToHex(const Digest &digest) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : digest) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

static int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

Digest hexToDigest(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::runtime_error("Invalid digest hex: expected " +
                             std::to_string(DIGEST_SIZE * 2) +
                             " characters, got " + std::to_string(hex.size()));
  }
  Digest digest{};
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    int hi = hexValue(hex[i * 2]);
    int lo = hexValue(hex[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      throw std::runtime_error("Invalid digest hex: non-hex character at offset " +
                               std::to_string(i * 2));
    }
    digest[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return digest;
}

std::string algorithmName(HashAlgorithm algo) {
  switch (algo) {
  case HashAlgorithm::SHA256:
    return "sha256";
  case HashAlgorithm::BLAKE3:
    return "blake3";
  default:
    return "unknown";
  }
}

HashAlgorithm parseAlgorithm(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "sha256" || lower == "sha-256")
    return HashAlgorithm::SHA256;
  if (lower == "blake3")
    return HashAlgorithm::BLAKE3;
  throw std::runtime_error("Unknown hash algorithm: " + name);
}

Block toBlock(const std::string &text) {
  Block block;
  block.reserve(text.size());
  for (char c : text)
    block.push_back(std::byte(c));
  return block;
}

} // namespace hashtree
