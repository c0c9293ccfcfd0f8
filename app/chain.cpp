#include "../ledger/Chain.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

const char *DEFAULT_CONFIG_FILE = "chain.json";
const char *DEFAULT_STORE_FILE = "chain.hckv";

// Creates a default config next to the given path if it does not exist
bool ensureConfig(const std::string &configPath) {
  auto logger = hc::logging::getLogger("hc.cli");
  if (std::filesystem::exists(configPath)) {
    return true;
  }

  logger.info << "No " << configPath << " found, creating with default values";
  hc::Chain::Config defaults;
  defaults.engine = hc::Chain::Config::ENGINE_FILE;
  std::filesystem::path storePath =
      std::filesystem::path(configPath).parent_path() / DEFAULT_STORE_FILE;
  defaults.path = storePath.string();

  auto result =
      hc::utl::writeToNewFile(configPath, defaults.toJson().dump(2) + "\n");
  if (!result) {
    std::cerr << "Error: Failed to create " << configPath << ": "
              << result.error().message << "\n";
    return false;
  }
  logger.info << "Created " << configPath;
  return true;
}

hc::Chain::Roe<hc::Chain::Config> loadConfig(const std::string &configPath) {
  auto json = hc::utl::loadJsonFile(configPath);
  if (!json) {
    return hc::Chain::Error(hc::Chain::E_CONFIG, json.error().message);
  }
  return hc::Chain::Config::fromJson(json.value());
}

int runInit(hc::Chain &chain) {
  auto result = chain.createGenesis();
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  if (!result.value()) {
    std::cout << "Chain already initialized\n";
    return 0;
  }
  std::cout << result.value()->toJson().dump(2) << "\n";
  return 0;
}

int runAppend(hc::Chain &chain, const std::vector<std::string> &payloads) {
  for (const auto &payload : payloads) {
    auto result = chain.append(payload);
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    std::cout << result.value().index << " " << hc::toHex(result.value().hash)
              << "\n";
  }
  return 0;
}

int runShow(hc::Chain &chain, int64_t index) {
  auto block = chain.getBlock(index);
  if (!block) {
    std::cerr << "Error: Block " << index << " not found\n";
    return 1;
  }
  std::cout << block->toJson().dump(2) << "\n";
  return 0;
}

int runDump(hc::Chain &chain, uint64_t fromIndex, uint64_t limit) {
  auto blocks = chain.getRange(fromIndex, limit);
  if (!blocks) {
    std::cerr << "Error: " << blocks.error().message << "\n";
    return 1;
  }
  nlohmann::json out = nlohmann::json::array();
  for (const auto &block : blocks.value()) {
    out.push_back(block.toJson());
  }
  std::cout << out.dump(2) << "\n";
  return 0;
}

int runValidate(hc::Chain &chain, uint64_t fromIndex) {
  int lastReported = -1;
  auto result = chain.validate(fromIndex, [&](double percent) {
    int step = static_cast<int>(percent) / 10;
    if (step != lastReported) {
      lastReported = step;
      std::cerr << "\rValidating... " << std::setw(3)
                << static_cast<int>(percent) << "%" << std::flush;
    }
  });
  if (lastReported >= 0) {
    std::cerr << "\n";
  }
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  std::cout << (result.value() ? "valid" : "invalid") << "\n";
  return result.value() ? 0 : 2;
}

// Adopt a chain previously written by dump, if it is valid and not shorter
int runReplace(hc::Chain &chain, const std::string &blocksPath) {
  auto json = hc::utl::loadJsonFile(blocksPath);
  if (!json) {
    std::cerr << "Error: " << json.error().message << "\n";
    return 1;
  }
  if (!json.value().is_array()) {
    std::cerr << "Error: " << blocksPath << " must hold a JSON array of blocks\n";
    return 1;
  }

  std::vector<hc::Block> candidate;
  candidate.reserve(json.value().size());
  for (const auto &item : json.value()) {
    auto block = hc::Block::fromJson(item);
    if (!block) {
      std::cerr << "Error: Block " << candidate.size() << " in " << blocksPath
                << ": " << block.error().message << "\n";
      return 1;
    }
    candidate.push_back(std::move(block.value()));
  }

  auto result = chain.replace(candidate);
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return result.error().code == hc::Chain::E_IO ? 1 : 2;
  }
  std::cout << "Replaced chain with " << candidate.size() << " blocks\n";
  return 0;
}

// Append blocks from several threads and check the chain afterwards
int runLoad(hc::Chain &chain, uint64_t blocks, uint32_t threads) {
  auto logger = hc::logging::getLogger("hc.cli");
  if (threads == 0) {
    threads = 1;
  }

  auto genesis = chain.createGenesis();
  if (!genesis) {
    std::cerr << "Error: " << genesis.error().message << "\n";
    return 1;
  }
  auto before = chain.getLength();
  if (!before) {
    std::cerr << "Error: " << before.error().message << "\n";
    return 1;
  }

  std::atomic<uint64_t> next{ 0 };
  std::atomic<uint64_t> failures{ 0 };
  auto start = std::chrono::steady_clock::now();

  std::vector<std::thread> workers;
  for (uint32_t t = 0; t < threads; ++t) {
    workers.emplace_back([&, t]() {
      for (uint64_t i = next++; i < blocks; i = next++) {
        auto result = chain.append("load-" + std::to_string(t) + "-" +
                                   std::to_string(i));
        if (!result) {
          logger.error << "Append failed: " << result.error().message;
          ++failures;
        }
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  auto after = chain.getLength();
  if (!after) {
    std::cerr << "Error: " << after.error().message << "\n";
    return 1;
  }
  auto valid = chain.validate(before.value() > 0 ? before.value() - 1 : 0);
  if (!valid) {
    std::cerr << "Error: " << valid.error().message << "\n";
    return 1;
  }

  nlohmann::json report;
  report["threads"] = threads;
  report["appended"] = after.value() - before.value();
  report["failures"] = failures.load();
  report["length"] = after.value();
  report["elapsedMs"] = elapsedMs;
  report["valid"] = valid.value();
  std::cout << report.dump(2) << "\n";
  return (failures.load() == 0 && valid.value()) ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"hc-chain - Append-only hash chain store"};
  app.require_subcommand(1);

  std::string configPath = DEFAULT_CONFIG_FILE;
  app.add_option("-c,--config", configPath, "Chain config file (JSON)")
      ->capture_default_str();

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging (default: warning level)");

  auto *init_cmd = app.add_subcommand("init", "Create the genesis block");

  auto *append_cmd = app.add_subcommand("append", "Append one block per payload");
  std::vector<std::string> payloads;
  append_cmd->add_option("payload", payloads, "Block payloads")->required();

  auto *show_cmd = app.add_subcommand("show", "Print a block as JSON");
  int64_t showIndex = 0;
  show_cmd->add_option("index", showIndex, "Block index")->required();

  auto *dump_cmd = app.add_subcommand("dump", "Print a range of blocks as JSON");
  uint64_t dumpFrom = 0;
  uint64_t dumpLimit = 0;
  dump_cmd->add_option("--from", dumpFrom, "First index")->capture_default_str();
  dump_cmd->add_option("--limit", dumpLimit, "Maximum blocks, 0 for all")
      ->capture_default_str();

  auto *validate_cmd = app.add_subcommand("validate", "Verify hashes and links");
  uint64_t validateFrom = 0;
  validate_cmd->add_option("--from", validateFrom, "First index to check")
      ->capture_default_str();

  auto *replace_cmd =
      app.add_subcommand("replace", "Adopt a longer valid chain from a dump file");
  std::string replaceFile;
  replace_cmd->add_option("--file", replaceFile, "JSON array written by dump")
      ->required()
      ->check(CLI::ExistingFile);

  auto *load_cmd = app.add_subcommand("load", "Concurrent append load test");
  uint64_t loadBlocks = 1000;
  uint32_t loadThreads = 4;
  load_cmd->add_option("--blocks", loadBlocks, "Blocks to append")
      ->capture_default_str();
  load_cmd->add_option("--threads", loadThreads, "Appending threads")
      ->check(CLI::Range(1, 256))
      ->capture_default_str();

  app.footer("Example:\n"
             "  hc-chain -c chain.json init\n"
             "  hc-chain -c chain.json append '{\"amount\":5}'\n"
             "  hc-chain -c chain.json validate\n"
             "  hc-chain -c other.json dump > blocks.json\n"
             "  hc-chain -c chain.json replace --file blocks.json\n"
             "\n"
             "A default config file is created if it doesn't exist.\n");

  CLI11_PARSE(app, argc, argv);

  hc::logging::getRootLogger().setLevel(debug ? hc::logging::Level::DEBUG
                                              : hc::logging::Level::WARNING);

  if (!ensureConfig(configPath)) {
    return 1;
  }
  auto config = loadConfig(configPath);
  if (!config) {
    std::cerr << "Error: Invalid config " << configPath << ": "
              << config.error().message << "\n";
    return 1;
  }

  hc::Chain chain;
  auto opened = chain.open(config.value());
  if (!opened) {
    std::cerr << "Error: " << opened.error().message << "\n";
    return 1;
  }

  int exitCode = 0;
  if (init_cmd->parsed()) {
    exitCode = runInit(chain);
  } else if (append_cmd->parsed()) {
    exitCode = runAppend(chain, payloads);
  } else if (show_cmd->parsed()) {
    exitCode = runShow(chain, showIndex);
  } else if (dump_cmd->parsed()) {
    exitCode = runDump(chain, dumpFrom, dumpLimit);
  } else if (validate_cmd->parsed()) {
    exitCode = runValidate(chain, validateFrom);
  } else if (replace_cmd->parsed()) {
    exitCode = runReplace(chain, replaceFile);
  } else if (load_cmd->parsed()) {
    exitCode = runLoad(chain, loadBlocks, loadThreads);
  }

  chain.close();
  return exitCode;
}
