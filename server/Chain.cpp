#include "Chain.h"

#include <algorithm>
#include <cmath>

namespace dpos {

// ----------------- Config -------------------------------------

Chain::Config Chain::defaultConfig() {
  Config config;
  config.genesisValidators = {
      {"genesis_validator_1", 1000000, 0.05},
      {"genesis_validator_2", 800000, 0.04},
      {"genesis_validator_3", 600000, 0.06},
  };
  config.genesisAccounts = {
      {"genesis_validator_1", 100000000},
      {"genesis_validator_2", 80000000},
      {"genesis_validator_3", 60000000},
      {"treasury", 200000000},
      {"community_fund", 100000000},
      {"development_fund", 50000000},
  };
  return config;
}

Chain::Roe<void> Chain::Config::ltsFromJson(const nlohmann::json &j) {
  try {
    if (j.contains("staking")) {
      const auto &s = j["staking"];
      staking.minStakeAmount = s.value("minStakeAmount", staking.minStakeAmount);
      staking.maxValidators = s.value("maxValidators", staking.maxValidators);
      staking.stakingRewardRate =
          s.value("stakingRewardRate", staking.stakingRewardRate);
      staking.unstakingPeriodMs =
          s.value("unstakingPeriodMs", staking.unstakingPeriodMs);
      staking.defaultCommission =
          s.value("defaultCommission", staking.defaultCommission);
    }
    maxTransactionsPerBlock =
        j.value("maxTransactionsPerBlock", maxTransactionsPerBlock);
    maxPendingTransactions =
        j.value("maxPendingTransactions", maxPendingTransactions);
    blockTimeMs = j.value("blockTimeMs", blockTimeMs);
    totalSupply = j.value("totalSupply", totalSupply);
    nativeToken = j.value("nativeToken", nativeToken);
    reserveAddress = j.value("reserveAddress", reserveAddress);
    sealingKey = j.value("sealingKey", sealingKey);

    if (j.contains("genesisValidators")) {
      genesisValidators.clear();
      for (const auto &v : j["genesisValidators"]) {
        genesisValidators.push_back(
            {v.at("address").get<std::string>(), v.at("stake").get<Amount>(),
             v.value("commission", staking.defaultCommission)});
      }
    }
    if (j.contains("genesisAccounts")) {
      genesisAccounts.clear();
      for (const auto &a : j["genesisAccounts"]) {
        genesisAccounts.push_back(
            {a.at("address").get<std::string>(), a.at("balance").get<Amount>()});
      }
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_STATE_CONFIG,
                 "Invalid chain configuration: " + std::string(e.what()));
  }

  if (maxTransactionsPerBlock == 0) {
    return Error(E_STATE_CONFIG, "maxTransactionsPerBlock must be positive");
  }
  if (!consensus::StakingRegistry::isValidCommission(staking.defaultCommission)) {
    return Error(E_STATE_CONFIG, "staking.defaultCommission must be in [0, 1), got " +
                                     std::to_string(staking.defaultCommission));
  }
  for (const auto &v : genesisValidators) {
    if (!consensus::StakingRegistry::isValidCommission(v.commission)) {
      return Error(E_STATE_CONFIG, "Commission for genesis validator " + v.address +
                                       " must be in [0, 1), got " +
                                       std::to_string(v.commission));
    }
  }
  return {};
}

nlohmann::json Chain::Config::ltsToJson() const {
  nlohmann::json j;
  j["staking"] = staking.toJson();
  j["maxTransactionsPerBlock"] = maxTransactionsPerBlock;
  j["maxPendingTransactions"] = maxPendingTransactions;
  j["blockTimeMs"] = blockTimeMs;
  j["totalSupply"] = totalSupply;
  j["nativeToken"] = nativeToken;
  j["reserveAddress"] = reserveAddress;
  j["genesisValidators"] = nlohmann::json::array();
  for (const auto &v : genesisValidators) {
    j["genesisValidators"].push_back(
        {{"address", v.address}, {"stake", v.stake}, {"commission", v.commission}});
  }
  j["genesisAccounts"] = nlohmann::json::array();
  for (const auto &a : genesisAccounts) {
    j["genesisAccounts"].push_back({{"address", a.address}, {"balance", a.balance}});
  }
  return j;
}

nlohmann::json Chain::NetworkStats::toJson() const {
  nlohmann::json j;
  j["totalSupply"] = totalSupply;
  j["circulatingSupply"] = circulatingSupply;
  j["burnedTokens"] = burnedTokens;
  j["mintedTokens"] = mintedTokens;
  j["totalStaked"] = totalStaked;
  j["totalValidators"] = totalValidators;
  j["activeValidators"] = activeValidators;
  j["totalAccounts"] = totalAccounts;
  j["chainLength"] = chainLength;
  j["pendingTransactions"] = pendingTransactions;
  j["averageBlockTime"] = averageBlockTimeMs;
  j["tps"] = tps;
  j["staking"] = staking.toJson();
  return j;
}

// ----------------- Chain -------------------------------------

Chain::Chain()
    : Module("Chain"), clock_(&utl::getCurrentTimeMs), staking_(ledger_),
      consensus_(staking_, ledger_) {
  ledger_.redirectLogger(getLoggerName() + ".Ledger");
  staking_.redirectLogger(getLoggerName() + ".Staking");
  consensus_.redirectLogger(getLoggerName() + ".Consensus");
  pool_.redirectLogger(getLoggerName() + ".Pool");
  swaps_.redirectLogger(getLoggerName() + ".Swap");
}

void Chain::setClock(Clock clock) {
  std::lock_guard<std::mutex> lock(mutex_);
  clock_ = clock;
  staking_.setClock(clock);
}

void Chain::setSeedFunction(consensus::ConsensusEngine::SeedFunction seed) {
  std::lock_guard<std::mutex> lock(mutex_);
  consensus_.setSeedFunction(std::move(seed));
}

Chain::Roe<void> Chain::init(const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (isInitialized_) {
    return Error(E_STATE_INIT, "Chain is already initialized");
  }

  config_ = config;
  staking_.setConfig(config_.staking);
  TransactionPool::Config poolConfig;
  poolConfig.maxSize = config_.maxPendingTransactions;
  pool_.setConfig(poolConfig);

  if (config_.sealingKey.empty()) {
    auto generated = utl::ed25519Generate();
    if (!generated) {
      return Error(E_STATE_INIT, "Failed to generate sealing key: " +
                                     generated.error().message);
    }
    sealingKey_ = generated.value();
    log().info << "Generated sealing key "
               << utl::hexEncode(sealingKey_.publicKey);
  } else {
    auto raw = utl::readPrivateKey(config_.sealingKey);
    if (!raw) {
      return Error(E_STATE_CONFIG, "Invalid sealing key: " + raw.error().message);
    }
    auto pair = utl::ed25519FromPrivateKey(raw.value());
    if (!pair) {
      return Error(E_STATE_CONFIG, "Invalid sealing key: " + pair.error().message);
    }
    sealingKey_ = pair.value();
  }

  Amount distributed = 0;
  for (const auto &account : config_.genesisAccounts) {
    auto result = ledger_.createAccount(account.address, account.balance);
    if (!result) {
      return Error(E_STATE_INIT, "Genesis account: " + result.error().message);
    }
    distributed += account.balance;
  }
  if (distributed > config_.totalSupply + AMOUNT_EPSILON) {
    return Error(E_STATE_CONFIG, "Genesis balances " +
                                     std::to_string(distributed) +
                                     " exceed total supply " +
                                     std::to_string(config_.totalSupply));
  }
  circulatingSupply_ = distributed;
  if (!config_.reserveAddress.empty()) {
    auto result = ledger_.createAccount(config_.reserveAddress,
                                        config_.totalSupply - distributed);
    if (!result) {
      return Error(E_STATE_INIT, "Reserve account: " + result.error().message);
    }
  }

  for (const auto &v : config_.genesisValidators) {
    auto result = staking_.addGenesisValidator(v.address, v.stake, v.commission);
    if (!result) {
      return Error(E_STATE_INIT, "Genesis validator: " + result.error().message);
    }
  }

  Block genesis(0, now(), Block::GENESIS_PREVIOUS_HASH, {},
                Block::GENESIS_VALIDATOR, ledger_.calculateStateRoot(), 0);
  auto signResult = genesis.sign(sealingKey_.privateKey);
  if (!signResult) {
    return Error(E_STATE_INIT, signResult.error().message);
  }
  auto appendResult = appendBlock(genesis);
  if (!appendResult) {
    return appendResult;
  }

  isInitialized_ = true;
  log().info << "Initialized chain with " << ledger_.getAccountCount()
             << " accounts and " << staking_.getValidatorCount()
             << " validators, genesis " << genesis.getHash();
  return {};
}

// ----------------- accessors -------------------------------------

std::string Chain::getSealingPublicKey() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sealingKey_.publicKey;
}

Amount Chain::getBalance(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ledger_.getBalance(address);
}

Chain::Roe<Ledger::Account> Chain::getAccount(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = ledger_.getAccount(address);
  if (!result) {
    return Error(E_ACCOUNT_NOT_FOUND, result.error().message);
  }
  return result.value();
}

Chain::Roe<Block> Chain::getBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= blocks_.size()) {
    return Error(E_BLOCK_NOT_FOUND, "Block not found: " + std::to_string(index));
  }
  return blocks_[index];
}

Chain::Roe<Block> Chain::getBlockByHash(const std::string &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = mBlockByHash_.find(hash);
  if (it == mBlockByHash_.end()) {
    return Error(E_BLOCK_NOT_FOUND, "Block not found: " + hash);
  }
  return blocks_[it->second];
}

Chain::Roe<Transaction> Chain::getTransaction(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto pending = pool_.find(id);
  if (pending) {
    return pending.value();
  }
  auto it = mBlockByTxId_.find(id);
  if (it != mBlockByTxId_.end()) {
    for (const auto &tx : blocks_[it->second].getTransactions()) {
      if (tx.getId() == id) {
        return tx;
      }
    }
  }
  return Error(E_TX_NOT_FOUND, "Transaction not found: " + id);
}

std::vector<Transaction> Chain::getPendingTransactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pool_.getTransactions();
}

std::vector<Block> Chain::getBlocks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_;
}

size_t Chain::getChainLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

Block Chain::getLatestBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.empty() ? Block() : blocks_.back();
}

Chain::Roe<consensus::Validator>
Chain::getValidator(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = staking_.getValidator(address);
  if (!result) {
    return Error(E_ACCOUNT_NOT_FOUND, result.error().message);
  }
  return result.value();
}

std::vector<consensus::Validator> Chain::getValidators() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return staking_.getValidators();
}

std::vector<consensus::Validator> Chain::getActiveValidators() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return staking_.getActiveValidators();
}

std::vector<consensus::Delegation>
Chain::getDelegations(const std::string &delegator) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return staking_.getDelegations(delegator);
}

Chain::Roe<SwapRegistry::SwapPair>
Chain::getSwapPair(const std::string &tokenA, const std::string &tokenB) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = swaps_.getPair(tokenA, tokenB);
  if (!result) {
    return Error(E_TX_SWAP, result.error().message);
  }
  return result.value();
}

Chain::NetworkStats Chain::getNetworkStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return collectNetworkStats();
}

Chain::NetworkStats Chain::collectNetworkStats() const {
  auto stakingStats = staking_.getStats();

  NetworkStats stats;
  stats.totalSupply = config_.totalSupply;
  stats.circulatingSupply = circulatingSupply_;
  stats.burnedTokens = burnedTokens_;
  stats.mintedTokens = mintedTokens_;
  stats.totalStaked = stakingStats.totalStaked;
  stats.totalValidators = stakingStats.totalValidators;
  stats.activeValidators = stakingStats.activeValidators;
  stats.totalAccounts = stakingStats.totalAccounts;
  stats.chainLength = blocks_.size();
  stats.pendingTransactions = pool_.size();
  stats.staking = stakingStats.config;

  if (blocks_.size() > 1) {
    int64_t totalTime = blocks_.back().getTimestamp() - blocks_.front().getTimestamp();
    stats.averageBlockTimeMs =
        static_cast<double>(totalTime) / static_cast<double>(blocks_.size() - 1);
    size_t totalTransactions = 0;
    for (const auto &block : blocks_) {
      totalTransactions += block.getTransactionCount();
    }
    if (totalTime > 0) {
      stats.tps = static_cast<double>(totalTransactions) * 1000.0 /
                  static_cast<double>(totalTime);
    }
  }
  return stats;
}

nlohmann::json Chain::exportChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json j;
  j["chain"] = nlohmann::json::array();
  for (const auto &block : blocks_) {
    j["chain"].push_back(block.toJson());
  }
  j["pendingTransactions"] = nlohmann::json::array();
  for (const auto &tx : pool_.getTransactions()) {
    j["pendingTransactions"].push_back(tx.toJson());
  }
  j["totalSupply"] = config_.totalSupply;
  j["circulatingSupply"] = circulatingSupply_;
  j["burnedTokens"] = burnedTokens_;
  j["mintedTokens"] = mintedTokens_;
  j["swapPairs"] = nlohmann::json::object();
  for (const auto &pair : swaps_.getPairs()) {
    j["swapPairs"][SwapRegistry::pairKey(pair.tokenA, pair.tokenB)] =
        pair.toJson();
  }
  j["validators"] = nlohmann::json::array();
  for (const auto &v : staking_.getValidators()) {
    j["validators"].push_back(v.toJson());
  }
  j["stats"] = collectNetworkStats().toJson();
  return j;
}

Chain::Roe<void> Chain::validateBlocks(const std::vector<Block> &blocks,
                                       const std::string &sealingPublicKey) {
  if (blocks.empty()) {
    return Error(E_BLOCK_GENESIS, "Chain has no genesis block");
  }
  if (blocks.front().getPreviousHash() != Block::GENESIS_PREVIOUS_HASH) {
    return Error(E_BLOCK_GENESIS, "Genesis block must reference previous hash \"" +
                                      std::string(Block::GENESIS_PREVIOUS_HASH) +
                                      "\"");
  }

  for (size_t i = 0; i < blocks.size(); ++i) {
    const Block &block = blocks[i];
    if (block.getIndex() != i) {
      return Error(E_BLOCK_INDEX, "Block at position " + std::to_string(i) +
                                      " has index " +
                                      std::to_string(block.getIndex()));
    }
    if (i > 0 && block.getPreviousHash() != blocks[i - 1].getHash()) {
      return Error(E_BLOCK_CHAIN, "Block " + std::to_string(i) +
                                      " does not link to its predecessor");
    }
    auto structure = block.validateStructure();
    if (!structure) {
      return Error(E_BLOCK_HASH, structure.error().message);
    }
    if (!sealingPublicKey.empty() && !block.verifySignature(sealingPublicKey)) {
      return Error(E_BLOCK_SIGNATURE, "Invalid producer signature on block " +
                                          std::to_string(i));
    }
  }
  return {};
}

bool Chain::isChainValid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = validateBlocks(blocks_, sealingKey_.publicKey);
  if (!result) {
    log().warning << "Chain validation failed: " << result.error().message;
    return false;
  }
  return true;
}

bool Chain::shouldAutoMine() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isMiningDue(now());
}

bool Chain::shouldAutoMine(int64_t nowMs) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return isMiningDue(nowMs);
}

bool Chain::isMiningDue(int64_t nowMs) const {
  if (pool_.isEmpty()) {
    return false;
  }
  if (pool_.size() >= config_.maxTransactionsPerBlock) {
    return true;
  }
  int64_t lastBlockTime = blocks_.empty() ? 0 : blocks_.back().getTimestamp();
  return nowMs - lastBlockTime >= config_.blockTimeMs;
}

// ----------------- transactions -------------------------------------

Chain::Roe<void> Chain::checkSwap(const Transaction &tx,
                                  const Ledger::Account &account) const {
  const auto *swap = tx.getSwapPayload();
  if (!swap) {
    return Error(E_TX_SWAP, "Swap transaction without swap data");
  }
  auto quoted = swaps_.quote(swap->tokenA, swap->tokenB, swap->amountIn);
  if (!quoted) {
    return Error(E_TX_SWAP, quoted.error().message);
  }
  if (quoted.value() < swap->minAmountOut) {
    return Error(E_TX_SWAP, "Slippage: output " + std::to_string(quoted.value()) +
                                " below minimum " +
                                std::to_string(swap->minAmountOut));
  }
  if (swap->tokenA == config_.nativeToken) {
    if (account.balance < swap->amountIn + tx.getFee()) {
      return Error(E_ACCOUNT_BALANCE, "Insufficient balance for swap");
    }
  } else if (account.getTokenBalance(swap->tokenA) < swap->amountIn ||
             account.balance < tx.getFee()) {
    return Error(E_ACCOUNT_BALANCE,
                 "Insufficient " + swap->tokenA + " balance for swap");
  }
  return {};
}

Chain::Roe<void> Chain::checkAdmission(const Transaction &tx) const {
  auto valid = tx.validate(now());
  if (!valid) {
    return Error(E_TX_VALIDATION, valid.error().message);
  }

  auto account = ledger_.getAccount(tx.getFrom());
  if (!account) {
    return Error(E_ACCOUNT_NOT_FOUND, "Sender account not found: " + tx.getFrom());
  }
  if (!account->publicKey.empty() && !tx.verifySignature(account->publicKey)) {
    return Error(E_TX_SIGNATURE, "Invalid signature for transaction " + tx.getId());
  }

  const Amount total = tx.getAmount() + tx.getFee();
  switch (tx.getType()) {
  case Transaction::Type::TRANSFER:
    if (account->balance < total) {
      return Error(E_ACCOUNT_BALANCE, "Insufficient balance: " +
                                          std::to_string(account->balance) +
                                          " < " + std::to_string(total));
    }
    break;

  case Transaction::Type::STAKE: {
    if (tx.getAmount() < config_.staking.minStakeAmount) {
      return Error(E_TX_STAKE, "Minimum stake amount is " +
                                   std::to_string(config_.staking.minStakeAmount));
    }
    if (account->balance < total) {
      return Error(E_ACCOUNT_BALANCE, "Insufficient balance for staking: " +
                                          std::to_string(account->balance) +
                                          " < " + std::to_string(total));
    }
    const std::string &target = tx.getStakeTarget();
    if (!staking_.hasValidator(target)) {
      if (consensus::StakingRegistry::classify(tx.getFrom(), target) !=
          consensus::StakeIntent::SELF_NOMINATION) {
        return Error(E_TX_STAKE, "Cannot delegate to unknown validator: " + target);
      }
      if (staking_.getValidatorCount() >= config_.staking.maxValidators) {
        return Error(E_TX_STAKE, "Maximum number of validators reached");
      }
    }
    break;
  }

  case Transaction::Type::UNSTAKE: {
    if (account->balance < tx.getFee()) {
      return Error(E_ACCOUNT_BALANCE, "Insufficient balance for unstake fee");
    }
    const std::string &target = tx.getStakeTarget();
    auto records = staking_.getDelegations(tx.getFrom());
    auto it = std::find_if(records.begin(), records.end(),
                           [&target](const consensus::Delegation &d) {
                             return d.validator == target;
                           });
    if (it == records.end() || it->stakedAmount <= 0) {
      return Error(E_TX_UNSTAKE, "No staking record for " + tx.getFrom() +
                                     " on " + target);
    }
    if (it->stakedAmount + AMOUNT_EPSILON < tx.getAmount()) {
      return Error(E_TX_UNSTAKE, "Insufficient staked amount: " +
                                     std::to_string(it->stakedAmount));
    }
    break;
  }

  case Transaction::Type::SWAP: {
    auto swapCheck = checkSwap(tx, account.value());
    if (!swapCheck) {
      return swapCheck;
    }
    break;
  }
  }

  if (mBlockByTxId_.count(tx.getId()) > 0) {
    return Error(E_TX_POOL, "Transaction already confirmed: " + tx.getId());
  }
  return {};
}

Chain::Roe<void> Chain::addTransaction(const Transaction &tx) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto admission = checkAdmission(tx);
  if (!admission) {
    log().debug << "Rejected transaction " << tx.getId() << ": "
                << admission.error().message;
    return admission;
  }
  auto queued = pool_.add(tx);
  if (!queued) {
    return Error(E_TX_POOL, queued.error().message);
  }
  return {};
}

Chain::Roe<void> Chain::applySwap(const Transaction &tx) {
  auto account = ledger_.getAccount(tx.getFrom());
  if (!account) {
    return Error(E_ACCOUNT_NOT_FOUND, account.error().message);
  }
  auto check = checkSwap(tx, account.value());
  if (!check) {
    return check;
  }

  const auto *swap = tx.getSwapPayload();
  auto swapped = swaps_.swap(swap->tokenA, swap->tokenB, swap->amountIn,
                             swap->minAmountOut);
  if (!swapped) {
    return Error(E_TX_SWAP, swapped.error().message);
  }
  Amount amountOut = swapped.value();

  if (swap->tokenA == config_.nativeToken) {
    ledger_.adjustBalance(tx.getFrom(), -(swap->amountIn + tx.getFee()));
  } else {
    ledger_.adjustTokenBalance(tx.getFrom(), swap->tokenA, -swap->amountIn);
    ledger_.adjustBalance(tx.getFrom(), -tx.getFee());
  }
  if (swap->tokenB == config_.nativeToken) {
    ledger_.adjustBalance(tx.getFrom(), amountOut);
  } else {
    ledger_.adjustTokenBalance(tx.getFrom(), swap->tokenB, amountOut);
  }
  return {};
}

Chain::Roe<void> Chain::applyTransaction(const Transaction &tx) {
  auto account = ledger_.getAccount(tx.getFrom());
  if (!account) {
    return Error(E_ACCOUNT_NOT_FOUND, "Sender account not found: " + tx.getFrom());
  }
  const Amount balance = account->balance;

  switch (tx.getType()) {
  case Transaction::Type::TRANSFER:
    if (!ledger_.adjustBalance(tx.getFrom(), -(tx.getAmount() + tx.getFee()))) {
      return Error(E_ACCOUNT_BALANCE, "Insufficient balance for transfer");
    }
    ledger_.ensureAccount(tx.getTo());
    ledger_.adjustBalance(tx.getTo(), tx.getAmount());
    break;

  case Transaction::Type::STAKE: {
    if (balance < tx.getAmount() + tx.getFee()) {
      return Error(E_ACCOUNT_BALANCE, "Insufficient balance for stake and fee");
    }
    auto staked = staking_.stake(tx.getFrom(), tx.getStakeTarget(), tx.getAmount());
    if (!staked) {
      return Error(E_STAKE, staked.error().message);
    }
    ledger_.adjustBalance(tx.getFrom(), -tx.getFee());
    break;
  }

  case Transaction::Type::UNSTAKE: {
    if (balance < tx.getFee()) {
      return Error(E_ACCOUNT_BALANCE, "Insufficient balance for unstake fee");
    }
    auto unstaked =
        staking_.unstake(tx.getFrom(), tx.getStakeTarget(), tx.getAmount());
    if (!unstaked) {
      return Error(E_UNSTAKE, unstaked.error().message);
    }
    ledger_.adjustBalance(tx.getFrom(), -tx.getFee());
    break;
  }

  case Transaction::Type::SWAP: {
    auto swapped = applySwap(tx);
    if (!swapped) {
      return swapped;
    }
    break;
  }
  }

  ledger_.incrementNonce(tx.getFrom());
  return {};
}

Chain::Roe<void> Chain::appendBlock(Block block) {
  uint64_t index = block.getIndex();
  if (index != blocks_.size()) {
    return Error(E_BLOCK_INDEX, "Expected block index " +
                                    std::to_string(blocks_.size()) + ", got " +
                                    std::to_string(index));
  }
  mBlockByHash_[block.getHash()] = index;
  for (const auto &tx : block.getTransactions()) {
    mBlockByTxId_[tx.getId()] = index;
  }
  blocks_.push_back(std::move(block));
  return {};
}

Chain::Roe<std::optional<Block>> Chain::mineBlock() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isInitialized_) {
    return Error(E_STATE_INIT, "Chain is not initialized");
  }
  if (pool_.isEmpty()) {
    return std::optional<Block>();
  }
  // Nothing is applied unless the block can be sealed afterwards
  auto sealer = utl::ed25519FromPrivateKey(sealingKey_.privateKey);
  if (!sealer) {
    return Error(E_BLOCK_SIGNATURE, "Unusable sealing key: " + sealer.error().message);
  }

  uint64_t index = blocks_.size();
  auto selected = consensus_.selectValidator(index);
  if (!selected) {
    return Error(E_CONSENSUS_VALIDATOR, selected.error().message);
  }
  const std::string validator = selected.value();

  std::vector<Transaction> included;
  std::vector<std::string> processed;
  for (const auto &tx : pool_.peek(config_.maxTransactionsPerBlock)) {
    processed.push_back(tx.getId());
    auto applied = applyTransaction(tx);
    if (!applied) {
      log().warning << "Dropped transaction " << tx.getId() << ": "
                    << applied.error().message;
      continue;
    }
    included.push_back(tx);
  }

  Amount totalFees = 0;
  for (const auto &tx : included) {
    totalFees += tx.getFee();
  }
  Amount reward = consensus_.calculateBlockReward(index, included.size(), totalFees);
  Amount issued = reward - totalFees;
  circulatingSupply_ += issued;
  mintedTokens_ += issued;
  consensus_.distributeStakingRewards(reward, validator);

  Block block(index, now(), blocks_.back().getHash(), included, validator,
              ledger_.calculateStateRoot(), reward);
  auto signResult = block.sign(sealingKey_.privateKey);
  if (!signResult) {
    return Error(E_BLOCK_SIGNATURE, "Failed to seal block " + std::to_string(index) +
                                        ": " + signResult.error().message);
  }

  auto appended = appendBlock(block);
  if (!appended) {
    return appended.error();
  }
  pool_.remove(processed);
  staking_.updateValidatorAfterBlock(validator, index);

  log().info << "Mined block " << index << " by " << validator << " with "
             << included.size() << " transactions, reward " << reward
             << ", hash " << block.getHash();
  return std::optional<Block>(block);
}

// ----------------- accounts and staking -------------------------------------

Chain::Roe<void> Chain::createAccount(const std::string &address,
                                      Amount initialBalance,
                                      const std::string &publicKey) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = ledger_.createAccount(address, initialBalance, publicKey);
  if (!result) {
    int32_t code = result.error().code == Ledger::E_ACCOUNT_EXISTS
                       ? E_ACCOUNT_EXISTS
                       : E_STATE_CONFIG;
    return Error(code, result.error().message);
  }
  return {};
}

Chain::Roe<void> Chain::registerPublicKey(const std::string &address,
                                          const std::string &publicKey) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ledger_.setPublicKey(address, publicKey)) {
    return Error(E_ACCOUNT_NOT_FOUND, "Account not found: " + address);
  }
  return {};
}

Chain::Roe<void> Chain::stake(const std::string &delegator,
                              const std::string &validator, Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = staking_.stake(delegator, validator, amount);
  if (!result) {
    return Error(E_STAKE, result.error().message);
  }
  return {};
}

Chain::Roe<void> Chain::unstake(const std::string &delegator,
                                const std::string &validator, Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = staking_.unstake(delegator, validator, amount);
  if (!result) {
    return Error(E_UNSTAKE, result.error().message);
  }
  return {};
}

Chain::Roe<Amount> Chain::completeUnstaking(const std::string &delegator) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = staking_.completeUnstaking(delegator);
  if (!result) {
    return Error(E_ACCOUNT_NOT_FOUND, result.error().message);
  }
  return result.value();
}

// ----------------- token economics -------------------------------------

bool Chain::burnTokens(Amount amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!(amount > 0) || amount > circulatingSupply_) {
    return false;
  }
  burnedTokens_ += amount;
  circulatingSupply_ -= amount;
  log().info << "Burned " << amount << " tokens, circulating "
             << circulatingSupply_;
  return true;
}

bool Chain::createSwapPair(const std::string &tokenA, const std::string &tokenB,
                           Amount reserveA, Amount reserveB) {
  std::lock_guard<std::mutex> lock(mutex_);
  return swaps_.createPair(tokenA, tokenB, reserveA, reserveB);
}

} // namespace dpos
