#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../server/Chain.h"
#include "../server/Miner.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{ true };

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
  }
}

struct RunOptions {
  std::string configPath;
  std::string transactionsPath;
  std::string exportPath;
  int64_t pollIntervalMs{ 100 };
  bool debug{ false };
};

// Each entry is a transaction object, optionally carrying "privateKey" (hex)
// to sign it before submission
int submitTransactions(dpos::Chain &chain, const std::string &path,
                       dpos::logging::Logger &logger) {
  auto content = dpos::utl::loadJsonFile(path);
  if (!content) {
    logger.error << content.error().message;
    return -1;
  }
  if (!content->is_array()) {
    logger.error << "Transactions file must hold a JSON array: " << path;
    return -1;
  }

  int accepted = 0;
  for (const auto &entry : content.value()) {
    auto tx = dpos::Transaction::fromJson(entry);
    if (!tx) {
      logger.warning << "Skipping transaction: " << tx.error().message;
      continue;
    }
    if (entry.contains("privateKey")) {
      if (!entry["privateKey"].is_string()) {
        logger.warning << "Skipping transaction " << tx->getId()
                       << ": privateKey must be a hex string or key file path";
        continue;
      }
      auto key = dpos::utl::readPrivateKey(entry["privateKey"].get<std::string>());
      if (!key) {
        logger.warning << "Skipping transaction " << tx->getId() << ": "
                       << key.error().message;
        continue;
      }
      auto signResult = tx->sign(key.value());
      if (!signResult) {
        logger.warning << "Skipping transaction " << tx->getId() << ": "
                       << signResult.error().message;
        continue;
      }
    }
    auto result = chain.addTransaction(tx.value());
    if (!result) {
      logger.warning << "Rejected " << tx->getId() << ": "
                     << result.error().message;
      continue;
    }
    accepted++;
  }
  return accepted;
}

int runChain(const RunOptions &options) {
  auto logger = dpos::logging::getLogger("dpos-ledger");

  dpos::Chain::Config config = dpos::Chain::defaultConfig();
  std::string logLevel = options.debug ? "debug" : "info";
  if (!options.configPath.empty()) {
    auto json = dpos::utl::loadJsonFile(options.configPath);
    if (!json) {
      std::cerr << "Error: " << json.error().message << "\n";
      return 1;
    }
    auto result = config.ltsFromJson(json.value());
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    if (!options.debug) {
      logLevel = json->value("logLevel", logLevel);
    }
    std::string logFile = json->value("logFile", std::string());
    if (!logFile.empty()) {
      try {
        dpos::logging::getRootLogger().addFileHandler(logFile,
                                                      dpos::logging::Level::DEBUG);
      } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
      }
    }
  }
  dpos::logging::getRootLogger().setLevel(dpos::logging::levelFromString(logLevel));

  dpos::Chain chain;
  auto initResult = chain.init(config);
  if (!initResult) {
    logger.critical << "Failed to initialize chain: " << initResult.error().message;
    return 1;
  }

  if (!options.transactionsPath.empty()) {
    int accepted = submitTransactions(chain, options.transactionsPath, logger);
    if (accepted < 0) {
      return 1;
    }
    logger.info << "Accepted " << accepted << " transactions";
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  dpos::Miner miner(chain);
  miner.setConfig({ options.pollIntervalMs });
  auto startResult = miner.start();
  if (!startResult) {
    logger.critical << "Failed to start miner: " << startResult.error().message;
    return 1;
  }

  while (g_running && !miner.hasFailed() &&
         !chain.getPendingTransactions().empty()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(options.pollIntervalMs));
  }
  miner.stop();
  if (miner.hasFailed()) {
    logger.critical << "Miner stopped after repeated failures, "
                    << chain.getPendingTransactions().size()
                    << " transactions left pending";
    return 1;
  }

  bool isValid = chain.isChainValid();
  logger.info << "Chain length " << chain.getChainLength() << ", "
              << (isValid ? "valid" : "INVALID");
  std::cout << chain.getNetworkStats().toJson().dump(2) << std::endl;

  if (!options.exportPath.empty()) {
    auto writeResult =
        dpos::utl::writeToNewFile(options.exportPath, chain.exportChain().dump(2));
    if (!writeResult) {
      logger.error << writeResult.error().message;
      return 1;
    }
    logger.info << "Exported chain to " << options.exportPath;
  }
  return isValid ? 0 : 2;
}

int runMkTx(const std::string &from, const std::string &to, double amount,
            const std::string &type, const std::string &validator,
            const std::string &key) {
  auto txType = dpos::Transaction::typeFromString(type);
  if (!txType) {
    std::cerr << "Error: " << txType.error().message << "\n";
    return 1;
  }
  dpos::Transaction::Payload payload;
  if (!validator.empty()) {
    payload = dpos::Transaction::StakePayload{ validator };
  }
  dpos::Transaction tx(from, to, amount, txType.value(), payload);
  if (!key.empty()) {
    auto raw = dpos::utl::readPrivateKey(key);
    if (!raw) {
      std::cerr << "Error: " << raw.error().message << "\n";
      return 1;
    }
    auto signResult = tx.sign(raw.value());
    if (!signResult) {
      std::cerr << "Error: " << signResult.error().message << "\n";
      return 1;
    }
  }
  std::cout << tx.toJson().dump(2) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"dpos-ledger - delegated Proof-of-Stake reference ledger"};
  app.require_subcommand(1);

  auto *keygen = app.add_subcommand("keygen", "Generate a new Ed25519 key pair");

  RunOptions runOptions;
  auto *run = app.add_subcommand("run", "Build a chain, mine pending transactions and report");
  run->add_option("-c,--config", runOptions.configPath, "Chain configuration (JSON)")
      ->check(CLI::ExistingFile);
  run->add_option("-t,--transactions", runOptions.transactionsPath,
                  "JSON array of transactions to submit")
      ->check(CLI::ExistingFile);
  run->add_option("-o,--export", runOptions.exportPath,
                  "Write the chain export to this new file");
  run->add_option("--interval", runOptions.pollIntervalMs, "Miner poll interval in ms")
      ->check(CLI::Range(1, 60000))
      ->capture_default_str();
  run->add_flag("--debug", runOptions.debug, "Enable debug logging");

  auto *mkTx = app.add_subcommand("mk-tx", "Print a transaction as JSON");
  std::string mkFrom;
  std::string mkTo;
  double mkAmount = 0;
  std::string mkType = "transfer";
  std::string mkValidator;
  std::string mkKey;
  mkTx->add_option("--from", mkFrom, "Sender address")->required();
  mkTx->add_option("--to", mkTo, "Recipient address")->required();
  mkTx->add_option("--amount", mkAmount, "Amount")->required();
  mkTx->add_option("--type", mkType, "transfer, stake, unstake or swap")
      ->capture_default_str();
  mkTx->add_option("--validator", mkValidator, "Stake target, defaults to recipient");
  mkTx->add_option("-k,--key", mkKey, "Private key (hex or file) to sign with");

  CLI11_PARSE(app, argc, argv);

  if (keygen->parsed()) {
    auto pair = dpos::utl::ed25519Generate();
    if (!pair.isOk()) {
      std::cerr << "Error: " << pair.error().message << "\n";
      return 1;
    }
    std::cout << "Public key (hex):   " << dpos::utl::hexEncode(pair->publicKey) << "\n";
    std::cout << "Private key (hex):  " << dpos::utl::hexEncode(pair->privateKey) << "\n";
    return 0;
  }

  if (mkTx->parsed()) {
    return runMkTx(mkFrom, mkTo, mkAmount, mkType, mkValidator, mkKey);
  }

  return runChain(runOptions);
}
