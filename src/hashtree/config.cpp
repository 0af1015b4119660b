#include "hashtree/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace hashtree {

size_t parseBlockSize(const std::string &text) {
  try {
    size_t pos = 0;
    long long value = std::stoll(text, &pos);
    if (pos != text.size() || value < 0)
      throw std::invalid_argument(text);
    return static_cast<size_t>(value);
  } catch (const std::logic_error &) {
    throw std::runtime_error("Invalid block size: " + text);
  }
}

static void applyEnvironment(RuntimeOptions &opts) {
  if (const char *env = std::getenv("HASHTREE_HASH_ALGO"))
    opts.hashAlgorithm = parseAlgorithm(env);
  if (const char *env = std::getenv("HASHTREE_BLOCK_SIZE"))
    opts.blockSize = parseBlockSize(env);
  if (const char *env = std::getenv("HASHTREE_LOG_LEVEL"))
    opts.logLevel = parseLogLevel(env);
  if (const char *env = std::getenv("HASHTREE_LOG_FILE"))
    opts.logFile = env;
}

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  RuntimeOptions opts;
  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["hash_algorithm"])
        opts.hashAlgorithm =
            parseAlgorithm(node["hash_algorithm"].as<std::string>());
      if (node["retain_nodes"])
        opts.retainNodes = node["retain_nodes"].as<bool>();
      if (node["block_size"])
        opts.blockSize = parseBlockSize(node["block_size"].as<std::string>());
      if (node["log_file"])
        opts.logFile = node["log_file"].as<std::string>();
      if (node["log_level"])
        opts.logLevel = parseLogLevel(node["log_level"].as<std::string>());
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Failed to parse config " + path + ": " +
                               e.what());
    }
  }
  applyEnvironment(opts);
  return opts;
}

RuntimeOptions loadRuntimeOptions() {
  const char *cfg = std::getenv("HASHTREE_CONFIG");
  if (!cfg)
    cfg = "hashtree_config.yaml";
  return loadRuntimeOptions(cfg);
}

} // namespace hashtree
