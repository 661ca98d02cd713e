#include "StakingRegistry.h"
#include "../lib/Utilities.h"

#include <algorithm>

namespace dpos {
namespace consensus {

nlohmann::json StakingRegistry::Config::toJson() const {
  return {{"minStakeAmount", minStakeAmount},
          {"maxValidators", maxValidators},
          {"stakingRewardRate", stakingRewardRate},
          {"unstakingPeriodMs", unstakingPeriodMs},
          {"defaultCommission", defaultCommission}};
}

nlohmann::json StakingRegistry::Stats::toJson() const {
  return {{"totalValidators", totalValidators},
          {"activeValidators", activeValidators},
          {"totalStaked", totalStaked},
          {"totalAccounts", totalAccounts},
          {"config", config.toJson()}};
}

StakingRegistry::StakingRegistry(Ledger &ledger)
    : Module("StakingRegistry"), ledger_(ledger),
      clock_(&utl::getCurrentTimeMs) {}

StakeIntent StakingRegistry::classify(const std::string &delegator,
                                      const std::string &validator) {
  return delegator == validator ? StakeIntent::SELF_NOMINATION
                                : StakeIntent::DELEGATION;
}

bool StakingRegistry::isValidCommission(double commission) {
  return commission >= 0 && commission < 1;
}

bool StakingRegistry::hasValidator(const std::string &address) const {
  return mValidatorIndex_.count(address) > 0;
}

StakingRegistry::Roe<Validator>
StakingRegistry::getValidator(const std::string &address) const {
  auto it = mValidatorIndex_.find(address);
  if (it == mValidatorIndex_.end()) {
    return Error(E_UNKNOWN_VALIDATOR, "Validator not found: " + address);
  }
  return validators_[it->second];
}

std::vector<Validator> StakingRegistry::getValidators() const {
  return validators_;
}

std::vector<Validator> StakingRegistry::getActiveValidators() const {
  std::vector<Validator> active;
  std::copy_if(validators_.begin(), validators_.end(),
               std::back_inserter(active),
               [](const Validator &v) { return v.isActive; });
  return active;
}

std::vector<Delegation>
StakingRegistry::getDelegations(const std::string &delegator) const {
  auto it = mDelegations_.find(delegator);
  if (it == mDelegations_.end()) {
    return {};
  }
  return it->second;
}

std::vector<Delegation>
StakingRegistry::getDelegationsTo(const std::string &validator) const {
  std::vector<Delegation> result;
  for (const auto &[delegator, records] : mDelegations_) {
    for (const auto &record : records) {
      if (record.validator == validator && record.stakedAmount > 0) {
        result.push_back(record);
      }
    }
  }
  return result;
}

StakingRegistry::Stats StakingRegistry::getStats() const {
  Stats stats;
  stats.totalValidators = validators_.size();
  for (const auto &v : validators_) {
    if (v.isActive) {
      stats.activeValidators++;
      stats.totalStaked += v.totalStake;
    }
  }
  stats.totalAccounts = ledger_.getAccountCount();
  stats.config = config_;
  return stats;
}

StakingRegistry::Roe<void> StakingRegistry::stake(const std::string &delegator,
                                                  const std::string &validator,
                                                  Amount amount) {
  return applyStake(classify(delegator, validator), delegator, validator,
                    amount);
}

StakingRegistry::Roe<void> StakingRegistry::nominate(const std::string &address,
                                                     Amount amount) {
  return applyStake(StakeIntent::SELF_NOMINATION, address, address, amount);
}

StakingRegistry::Roe<void>
StakingRegistry::delegate(const std::string &delegator,
                          const std::string &validator, Amount amount) {
  if (delegator == validator) {
    return Error(E_SELF_DELEGATION, "Cannot delegate to oneself: " + delegator +
                                        ", nominate instead");
  }
  return applyStake(StakeIntent::DELEGATION, delegator, validator, amount);
}

StakingRegistry::Roe<void>
StakingRegistry::applyStake(StakeIntent intent, const std::string &delegator,
                            const std::string &validator, Amount amount) {
  if (amount < config_.minStakeAmount) {
    return Error(E_AMOUNT_BELOW_MINIMUM,
                 "Minimum stake amount is " +
                     std::to_string(config_.minStakeAmount) + ", got " +
                     std::to_string(amount));
  }
  auto account = ledger_.getAccount(delegator);
  if (!account) {
    return Error(E_ACCOUNT_NOT_FOUND, "Delegator account not found: " +
                                          delegator);
  }
  if (account->balance < amount) {
    return Error(E_INSUFFICIENT_BALANCE,
                 "Insufficient balance for staking: " +
                     std::to_string(account->balance) + " < " +
                     std::to_string(amount));
  }

  bool isNew = !hasValidator(validator);
  if (isNew) {
    if (intent != StakeIntent::SELF_NOMINATION) {
      return Error(E_UNKNOWN_VALIDATOR,
                   "Cannot delegate to unknown validator: " + validator);
    }
    if (validators_.size() >= config_.maxValidators) {
      return Error(E_VALIDATOR_CAP, "Maximum number of validators reached (" +
                                        std::to_string(config_.maxValidators) +
                                        ")");
    }
  }

  if (!ledger_.adjustBalance(delegator, -amount)) {
    return Error(E_INSUFFICIENT_BALANCE,
                 "Failed to debit " + std::to_string(amount) + " from " +
                     delegator);
  }
  ledger_.adjustStaked(delegator, amount);

  if (isNew) {
    Validator v;
    v.address = validator;
    v.commission = config_.defaultCommission;
    mValidatorIndex_[validator] = validators_.size();
    validators_.push_back(v);
    ledger_.setValidatorFlag(validator, true);
    log().info << "Registered validator " << validator;
  }

  Validator &v = *findValidator(validator);
  v.totalStake += amount;
  if (intent == StakeIntent::SELF_NOMINATION) {
    v.selfStake += amount;
  }
  refreshActive(v);
  addRecord(delegator, validator, amount);

  log().debug << delegator << " staked " << amount << " on " << validator
              << " (total " << v.totalStake << ")";
  return {};
}

void StakingRegistry::addRecord(const std::string &delegator,
                                const std::string &validator, Amount amount) {
  Delegation *record = findDelegation(delegator, validator);
  if (record) {
    record->stakedAmount += amount;
    return;
  }
  Delegation d;
  d.delegator = delegator;
  d.validator = validator;
  d.stakedAmount = amount;
  mDelegations_[delegator].push_back(d);
}

StakingRegistry::Roe<void>
StakingRegistry::unstake(const std::string &delegator,
                         const std::string &validator, Amount amount) {
  if (!(amount > 0)) {
    return Error(E_INVALID_AMOUNT,
                 "Unstake amount must be positive: " + std::to_string(amount));
  }
  Delegation *record = findDelegation(delegator, validator);
  if (!record || record->stakedAmount <= 0) {
    return Error(E_NO_STAKING_RECORD, "No staking record for " + delegator +
                                          " on " + validator);
  }
  if (record->stakedAmount + AMOUNT_EPSILON < amount) {
    return Error(E_INSUFFICIENT_STAKE,
                 "Insufficient staked amount: " +
                     std::to_string(record->stakedAmount) + " < " +
                     std::to_string(amount));
  }

  record->stakedAmount = std::max<Amount>(record->stakedAmount - amount, 0);
  if (record->stakedAmount < AMOUNT_EPSILON) {
    record->stakedAmount = 0;
  }
  record->pendingRelease += amount;
  record->maturityTime = now() + config_.unstakingPeriodMs;

  Validator *v = findValidator(validator);
  if (v) {
    v->totalStake = std::max<Amount>(v->totalStake - amount, 0);
    if (delegator == validator) {
      v->selfStake = std::max<Amount>(v->selfStake - amount, 0);
    }
    refreshActive(*v);
  }
  ledger_.adjustStaked(delegator, -amount);

  log().debug << delegator << " unstaked " << amount << " from " << validator
              << ", matures at " << *record->maturityTime;
  return {};
}

StakingRegistry::Roe<Amount>
StakingRegistry::completeUnstaking(const std::string &delegator) {
  if (!ledger_.hasAccount(delegator)) {
    return Error(E_ACCOUNT_NOT_FOUND, "Account not found: " + delegator);
  }
  auto it = mDelegations_.find(delegator);
  if (it == mDelegations_.end()) {
    return Amount(0);
  }

  int64_t current = now();
  Amount released = 0;
  auto &records = it->second;
  for (auto &record : records) {
    if (record.maturityTime && *record.maturityTime <= current) {
      released += record.pendingRelease;
      record.pendingRelease = 0;
      record.maturityTime.reset();
    }
  }
  records.erase(std::remove_if(records.begin(), records.end(),
                               [](const Delegation &d) {
                                 return d.stakedAmount <= 0 && !d.maturityTime;
                               }),
                records.end());
  if (records.empty()) {
    mDelegations_.erase(it);
  }

  if (released > 0) {
    ledger_.adjustBalance(delegator, released);
    log().info << "Released " << released << " unstaked by " << delegator;
  }
  return released;
}

void StakingRegistry::updateValidatorAfterBlock(const std::string &validator,
                                                uint64_t blockIndex) {
  Validator *v = findValidator(validator);
  if (!v) {
    return;
  }
  v->blocksProduced++;
  v->lastActiveBlock = blockIndex;
}

bool StakingRegistry::creditDelegationReward(const std::string &delegator,
                                             const std::string &validator,
                                             Amount amount) {
  Delegation *record = findDelegation(delegator, validator);
  if (!record || !ledger_.creditRewards(delegator, amount)) {
    return false;
  }
  record->rewards += amount;
  return true;
}

StakingRegistry::Roe<void>
StakingRegistry::addGenesisValidator(const std::string &address,
                                     Amount selfStake, double commission) {
  if (hasValidator(address)) {
    return Error(E_VALIDATOR_EXISTS, "Validator already registered: " + address);
  }
  if (validators_.size() >= config_.maxValidators) {
    return Error(E_VALIDATOR_CAP, "Maximum number of validators reached (" +
                                      std::to_string(config_.maxValidators) +
                                      ")");
  }
  if (!(selfStake > 0)) {
    return Error(E_INVALID_AMOUNT, "Genesis stake must be positive for " +
                                      address);
  }
  if (!isValidCommission(commission)) {
    return Error(E_INVALID_COMMISSION, "Commission for " + address +
                                           " must be in [0, 1), got " +
                                           std::to_string(commission));
  }

  ledger_.ensureAccount(address);
  ledger_.adjustStaked(address, selfStake);
  ledger_.setValidatorFlag(address, true);

  Validator v;
  v.address = address;
  v.selfStake = selfStake;
  v.totalStake = selfStake;
  v.commission = commission;
  refreshActive(v);
  mValidatorIndex_[address] = validators_.size();
  validators_.push_back(v);
  addRecord(address, address, selfStake);

  log().info << "Genesis validator " << address << " with stake " << selfStake;
  return {};
}

void StakingRegistry::refreshActive(Validator &validator) {
  bool active = validator.totalStake + AMOUNT_EPSILON >= config_.minStakeAmount;
  if (active != validator.isActive) {
    log().info << "Validator " << validator.address
               << (active ? " activated" : " deactivated") << " at stake "
               << validator.totalStake;
  }
  validator.isActive = active;
}

Validator *StakingRegistry::findValidator(const std::string &address) {
  auto it = mValidatorIndex_.find(address);
  return it == mValidatorIndex_.end() ? nullptr : &validators_[it->second];
}

Delegation *StakingRegistry::findDelegation(const std::string &delegator,
                                            const std::string &validator) {
  auto it = mDelegations_.find(delegator);
  if (it == mDelegations_.end()) {
    return nullptr;
  }
  for (auto &record : it->second) {
    if (record.validator == validator) {
      return &record;
    }
  }
  return nullptr;
}

} // namespace consensus
} // namespace dpos
