#ifndef DPOS_LEDGER_CHAIN_H
#define DPOS_LEDGER_CHAIN_H

#include "../consensus/ConsensusEngine.h"
#include "../consensus/StakingRegistry.h"
#include "../ledger/Block.h"
#include "../ledger/Ledger.h"
#include "../ledger/SwapRegistry.h"
#include "../ledger/Transaction.h"
#include "../ledger/TransactionPool.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/Utilities.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dpos {

/**
 * Chain - orchestrates ledger, staking, consensus and the transaction pool
 *
 * Provides:
 * - Transaction admission into the pool
 * - Block production: validator selection, application, rewards, sealing
 * - Chain validation and lookups
 * - Supply bookkeeping (burns, minted rewards) and swap pairs
 *
 * Every public operation runs under one mutex covering the whole aggregate,
 * so manual and timer-driven mining never consume the pool twice.
 */
class Chain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error code groups
  // State and initialization errors (1-9)
  constexpr static int32_t E_STATE_INIT = 1;   // Genesis setup failed
  constexpr static int32_t E_STATE_CONFIG = 2; // Invalid configuration

  // Block validation errors (10-29)
  constexpr static int32_t E_BLOCK_NOT_FOUND = 10; // Block not found
  constexpr static int32_t E_BLOCK_INDEX = 11;     // Block index mismatch
  constexpr static int32_t E_BLOCK_CHAIN = 12; // Block previous hash mismatch
  constexpr static int32_t E_BLOCK_HASH = 13;  // Content does not match hash
  constexpr static int32_t E_BLOCK_SIGNATURE = 14; // Producer signature invalid
  constexpr static int32_t E_BLOCK_GENESIS = 15;   // Genesis block malformed

  // Consensus errors (30-39)
  constexpr static int32_t E_CONSENSUS_VALIDATOR = 30; // No validator to select

  // Account errors (40-49)
  constexpr static int32_t E_ACCOUNT_NOT_FOUND = 40; // Account not found
  constexpr static int32_t E_ACCOUNT_EXISTS = 41;    // Account already exists
  constexpr static int32_t E_ACCOUNT_BALANCE = 42;   // Insufficient balance

  // Staking errors (50-59)
  constexpr static int32_t E_STAKE = 50;   // Stake rejected by registry
  constexpr static int32_t E_UNSTAKE = 51; // Unstake rejected by registry

  // Transaction errors (60-79)
  constexpr static int32_t E_TX_VALIDATION = 60; // Structural check failed
  constexpr static int32_t E_TX_SIGNATURE = 61;  // Invalid signature
  constexpr static int32_t E_TX_NOT_FOUND = 62;  // Unknown transaction id
  constexpr static int32_t E_TX_POOL = 63;       // Duplicate or pool full
  constexpr static int32_t E_TX_STAKE = 64;      // Stake precondition
  constexpr static int32_t E_TX_UNSTAKE = 65;    // Unstake precondition
  constexpr static int32_t E_TX_SWAP = 66;       // Swap precondition

  struct GenesisValidator {
    std::string address;
    Amount stake;
    double commission;
  };

  struct GenesisAccount {
    std::string address;
    Amount balance;
  };

  struct Config {
    consensus::StakingRegistry::Config staking;
    size_t maxTransactionsPerBlock{ 1000 };
    size_t maxPendingTransactions{ 10000 };
    int64_t blockTimeMs{ 10000 };
    Amount totalSupply{ 1000000000 };
    std::string nativeToken{ "DPOS" };
    std::string reserveAddress{ "reserve" }; // receives the undistributed supply
    std::vector<GenesisValidator> genesisValidators;
    std::vector<GenesisAccount> genesisAccounts;
    std::string sealingKey; // hex ed25519 private key or key file, generated if empty

    /** Overlays the keys present in j onto this configuration */
    Roe<void> ltsFromJson(const nlohmann::json &j);
    nlohmann::json ltsToJson() const;
  };

  struct NetworkStats {
    Amount totalSupply{ 0 };
    Amount circulatingSupply{ 0 };
    Amount burnedTokens{ 0 };
    Amount mintedTokens{ 0 };
    Amount totalStaked{ 0 };
    size_t totalValidators{ 0 };
    size_t activeValidators{ 0 };
    size_t totalAccounts{ 0 };
    size_t chainLength{ 0 };
    size_t pendingTransactions{ 0 };
    double averageBlockTimeMs{ 0 };
    double tps{ 0 };
    consensus::StakingRegistry::Config staking;

    nlohmann::json toJson() const;
  };

  using Clock = std::function<int64_t()>;

  /** Three validators, treasury and funds; the rest of the supply goes to the reserve */
  static Config defaultConfig();

  /**
   * Checks index sequence, hash linkage, block content against hashes, and
   * producer signatures when sealingPublicKey is given.
   */
  static Roe<void> validateBlocks(const std::vector<Block> &blocks,
                                  const std::string &sealingPublicKey);

  Chain();
  ~Chain() override = default;

  /** Replaces the wall clock for block timestamps, admission and maturity */
  void setClock(Clock clock);
  void setSeedFunction(consensus::ConsensusEngine::SeedFunction seed);

  Roe<void> init(const Config &config);

  // ----------------- accessors -------------------------------------
  const Config &getConfig() const { return config_; }
  std::string getSealingPublicKey() const;

  Amount getBalance(const std::string &address) const;
  Roe<Ledger::Account> getAccount(const std::string &address) const;
  Roe<Block> getBlock(uint64_t index) const;
  Roe<Block> getBlockByHash(const std::string &hash) const;
  Roe<Transaction> getTransaction(const std::string &id) const;
  std::vector<Transaction> getPendingTransactions() const;
  std::vector<Block> getBlocks() const;
  size_t getChainLength() const;
  Block getLatestBlock() const;

  Roe<consensus::Validator> getValidator(const std::string &address) const;
  std::vector<consensus::Validator> getValidators() const;
  std::vector<consensus::Validator> getActiveValidators() const;
  std::vector<consensus::Delegation>
  getDelegations(const std::string &delegator) const;
  Roe<SwapRegistry::SwapPair> getSwapPair(const std::string &tokenA,
                                          const std::string &tokenB) const;

  NetworkStats getNetworkStats() const;
  nlohmann::json exportChain() const;

  bool isChainValid() const;
  /** True when the pool fills a block or blockTimeMs passed since the tip */
  bool shouldAutoMine(int64_t nowMs) const;
  bool shouldAutoMine() const;

  // ----------------- methods -------------------------------------
  /** Admits a transaction into the pool; nothing is queued on error */
  Roe<void> addTransaction(const Transaction &tx);

  /**
   * Produces the next block from the pool.
   * @return nullopt when the pool is empty
   */
  Roe<std::optional<Block>> mineBlock();

  Roe<void> createAccount(const std::string &address, Amount initialBalance,
                          const std::string &publicKey = "");
  Roe<void> registerPublicKey(const std::string &address,
                              const std::string &publicKey);

  Roe<void> stake(const std::string &delegator, const std::string &validator,
                  Amount amount);
  Roe<void> unstake(const std::string &delegator, const std::string &validator,
                    Amount amount);
  Roe<Amount> completeUnstaking(const std::string &delegator);

  bool burnTokens(Amount amount);
  bool createSwapPair(const std::string &tokenA, const std::string &tokenB,
                      Amount reserveA, Amount reserveB);

private:
  Roe<void> checkAdmission(const Transaction &tx) const;
  Roe<void> checkSwap(const Transaction &tx, const Ledger::Account &account) const;
  Roe<void> applyTransaction(const Transaction &tx);
  Roe<void> applySwap(const Transaction &tx);
  Roe<void> appendBlock(Block block);
  NetworkStats collectNetworkStats() const;
  bool isMiningDue(int64_t nowMs) const;
  int64_t now() const { return clock_(); }

  mutable std::mutex mutex_;
  Config config_;
  Clock clock_;
  bool isInitialized_{ false };

  Ledger ledger_;
  consensus::StakingRegistry staking_;
  consensus::ConsensusEngine consensus_;
  TransactionPool pool_;
  SwapRegistry swaps_;

  std::vector<Block> blocks_;
  std::map<std::string, uint64_t> mBlockByHash_;
  std::map<std::string, uint64_t> mBlockByTxId_;
  utl::Ed25519KeyPair sealingKey_;

  Amount circulatingSupply_{ 0 };
  Amount burnedTokens_{ 0 };
  Amount mintedTokens_{ 0 };
};

} // namespace dpos

#endif // DPOS_LEDGER_CHAIN_H
