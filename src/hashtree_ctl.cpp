#include "hashtree/block_reader.hpp"
#include "hashtree/cid_utils.hpp"
#include "hashtree/config.hpp"
#include "hashtree/hasher.hpp"
#include "hashtree/logger.h"
#include "hashtree/merkle_tree.hpp"
#include "hashtree/self_test.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hashtree;

struct CommandArgs {
  std::vector<std::string> files;
  std::optional<std::string> expected; ///< verify only
  bool complete{true}; ///< false if an option was given without a value
};

static void usage() {
  std::cout << "Usage: hashtree_ctl root [--algo sha256|blake3] "
               "[--block-size N] <file>...";
  std::cout << "\n       hashtree_ctl verify <root-cid|root-hex> [--algo "
               "sha256|blake3] [--block-size N] <file>...";
  std::cout << "\n       hashtree_ctl demo\n";
}

// Options on the command line override the config file.
static CommandArgs parseArgs(int argc, char **argv, int first,
                             RuntimeOptions &opts) {
  CommandArgs args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--algo" || arg == "--block-size") && i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << std::endl;
      args.complete = false;
      break;
    }
    if (arg == "--algo") {
      opts.hashAlgorithm = parseAlgorithm(argv[++i]);
    } else if (arg == "--block-size") {
      opts.blockSize = parseBlockSize(argv[++i]);
    } else {
      args.files.push_back(arg);
    }
  }
  return args;
}

static void printTree(const MerkleTree &tree) {
  std::cout << "Algorithm\t" << algorithmName(tree.algorithm()) << std::endl;
  std::cout << "Leaves\t\t" << tree.leafCount() << std::endl;
  std::cout << "Height\t\t" << tree.height() << std::endl;
  std::cout << "Padding\t\t" << tree.paddingCount() << std::endl;
  std::cout << "Root\t\t" << tree.rootHex() << std::endl;
  std::cout << "CID\t\t" << tree.rootCid() << std::endl;
  if (tree.isMutated())
    std::cout << "Warning: input pairs identical blocks" << std::endl;
}

static int root_command(const CommandArgs &args, const RuntimeOptions &opts) {
  if (!args.complete || args.files.empty()) {
    usage();
    return 1;
  }
  auto hasher = makeHasher(opts.hashAlgorithm);
  TreeBuilder builder(*hasher, BuildOptions{opts.retainNodes});
  MerkleTree tree =
      builder.build(readBlocksFromFiles(args.files, opts.blockSize));
  printTree(tree);
  return 0;
}

static int verify_command(const CommandArgs &args, RuntimeOptions opts) {
  if (!args.complete || !args.expected || args.files.empty()) {
    usage();
    return 1;
  }
  HashAlgorithm cidAlgo = opts.hashAlgorithm;
  Digest expected = parseDigest(*args.expected, &cidAlgo);
  if (cidAlgo != opts.hashAlgorithm) {
    Logger::getInstance().log(LogLevel::INFO,
                              "Using " + algorithmName(cidAlgo) +
                                  " as named by the root CID");
    opts.hashAlgorithm = cidAlgo;
  }
  auto hasher = makeHasher(opts.hashAlgorithm);
  bool ok = verifyRoot(
      *hasher, readBlocksFromFiles(args.files, opts.blockSize), expected);
  std::cout << (ok ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  return ok ? 0 : 1;
}

// Three transactions; the last one is paired with itself.
static int demo_command(const RuntimeOptions &opts) {
  const std::vector<std::string> transactions = {
      "Tx1: Alice->Bob", "Tx2: Bob->Charlie", "Tx3: Charlie->Dave"};
  auto hasher = makeHasher(opts.hashAlgorithm);
  TreeBuilder builder(*hasher);

  std::cout << "Building tree for " << transactions.size()
            << " transactions..." << std::endl;
  MerkleTree tree = builder.buildFromStrings(transactions);
  printTree(tree);

  Digest h1 = hasher->hash(tree.leaves()[0]);
  Digest h2 = hasher->hash(tree.leaves()[1]);
  Digest h3 = hasher->hash(tree.leaves()[2]);
  Digest expected =
      hasher->hashPair(hasher->hashPair(h1, h2), hasher->hashPair(h3, h3));
  std::cout << "Manual\t\t" << digestToHex(expected) << std::endl;

  bool ok = tree.rootDigest() == expected;
  std::cout << (ok ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  return ok ? 0 : 1;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  std::string cmd = argv[1];

  RuntimeOptions opts;
  try {
    opts = loadRuntimeOptions();
    Logger::init(opts.logFile, opts.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Configuration failed: " << e.what() << std::endl;
    return 1;
  }

  if (!hasherSelfTest()) {
    std::cerr << "FATAL: Hasher self test failed" << std::endl;
    return 1;
  }

  try {
    if (cmd == "root") {
      return root_command(parseArgs(argc, argv, 2, opts), opts);
    } else if (cmd == "verify" && argc >= 3) {
      CommandArgs args = parseArgs(argc, argv, 3, opts);
      args.expected = argv[2];
      return verify_command(args, opts);
    } else if (cmd == "demo") {
      return demo_command(opts);
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}
