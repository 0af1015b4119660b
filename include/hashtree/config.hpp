#pragma once

#include "hashtree/digest.hpp"
#include "hashtree/logger.h"

#include <cstddef>
#include <string>

namespace hashtree {

struct RuntimeOptions {
  HashAlgorithm hashAlgorithm = HashAlgorithm::BLAKE3;
  bool retainNodes = true;
  size_t blockSize = 0; ///< 0 treats each input file as one block
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::INFO;
};

/**
 * @brief Parse a non-negative block size in bytes.
 * @throws std::runtime_error for negative or non-numeric text.
 */
size_t parseBlockSize(const std::string &text);

/**
 * @brief Load options from a YAML file, then apply environment overrides.
 *
 * A missing file leaves the defaults in place.
 * @throws std::runtime_error if the file cannot be parsed or a value is
 *         invalid.
 */
RuntimeOptions loadRuntimeOptions(const std::string &path);

/// loadRuntimeOptions() on $HASHTREE_CONFIG, or hashtree_config.yaml.
RuntimeOptions loadRuntimeOptions();

} // namespace hashtree
