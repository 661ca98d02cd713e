#pragma once

#include "../ledger/Ledger.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dpos {
namespace consensus {

/**
 * StakingRegistry - validators, delegation records and unstake maturity
 *
 * Moves value between spendable balances in the Ledger and staked positions.
 * For every address the ledger's staked total equals the sum of its
 * delegation records, and every validator's totalStake equals the sum of the
 * records pointing at it. A validator is active exactly when its totalStake
 * reaches the minimum stake.
 *
 * Not thread-safe; the owning Chain serializes access.
 */
class StakingRegistry : public Module {
public:
  struct Config {
    Amount minStakeAmount{ 100 };
    size_t maxValidators{ 21 };
    double stakingRewardRate{ 0.08 }; // annual, informational
    int64_t unstakingPeriodMs{ 7LL * 24 * 60 * 60 * 1000 };
    double defaultCommission{ 0.05 };

    nlohmann::json toJson() const;
  };

  struct Stats {
    size_t totalValidators{ 0 };
    size_t activeValidators{ 0 };
    Amount totalStaked{ 0 }; // by active validators
    size_t totalAccounts{ 0 };
    Config config;

    nlohmann::json toJson() const;
  };

  using Clock = std::function<int64_t()>;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Stake errors (1-19)
  constexpr static int32_t E_AMOUNT_BELOW_MINIMUM = 1; // Stake below minimum
  constexpr static int32_t E_INSUFFICIENT_BALANCE = 2; // Not enough spendable
  constexpr static int32_t E_ACCOUNT_NOT_FOUND = 3;    // Unknown delegator
  constexpr static int32_t E_UNKNOWN_VALIDATOR = 4;    // Delegation target
  constexpr static int32_t E_VALIDATOR_CAP = 5;        // maxValidators reached
  constexpr static int32_t E_VALIDATOR_EXISTS = 6;     // Genesis duplicate
  constexpr static int32_t E_INVALID_AMOUNT = 7;       // Non-positive amount
  constexpr static int32_t E_INVALID_COMMISSION = 8;   // Outside [0, 1)
  constexpr static int32_t E_SELF_DELEGATION = 9;      // Delegating to oneself
  // Unstake errors (20-29)
  constexpr static int32_t E_NO_STAKING_RECORD = 20;  // Nothing staked there
  constexpr static int32_t E_INSUFFICIENT_STAKE = 21; // Record too small

  explicit StakingRegistry(Ledger &ledger);
  ~StakingRegistry() override = default;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  /** Replaces the wall clock used for unstaking maturity */
  void setClock(Clock clock) { clock_ = std::move(clock); }
  int64_t now() const { return clock_(); }

  static StakeIntent classify(const std::string &delegator,
                              const std::string &validator);
  static bool isValidCommission(double commission);

  // ----------------- accessors -------------------------------------
  bool hasValidator(const std::string &address) const;
  Roe<Validator> getValidator(const std::string &address) const;

  /** All validators in registration order */
  std::vector<Validator> getValidators() const;
  /** Active validators in registration order */
  std::vector<Validator> getActiveValidators() const;
  size_t getValidatorCount() const { return validators_.size(); }

  std::vector<Delegation> getDelegations(const std::string &delegator) const;
  /** Records backing a validator, ordered by delegator address */
  std::vector<Delegation> getDelegationsTo(const std::string &validator) const;
  Stats getStats() const;

  // ----------------- methods -------------------------------------
  /** Dispatches to nominate() or delegate() */
  Roe<void> stake(const std::string &delegator, const std::string &validator,
                  Amount amount);
  Roe<void> nominate(const std::string &address, Amount amount);
  Roe<void> delegate(const std::string &delegator, const std::string &validator,
                     Amount amount);

  Roe<void> unstake(const std::string &delegator, const std::string &validator,
                    Amount amount);

  /**
   * Releases every matured pending amount to the spendable balance.
   * @return Total released, 0 when nothing has matured
   */
  Roe<Amount> completeUnstaking(const std::string &delegator);

  void updateValidatorAfterBlock(const std::string &validator,
                                 uint64_t blockIndex);
  bool creditDelegationReward(const std::string &delegator,
                              const std::string &validator, Amount amount);

  /** Registers a validator backed by stake that is not taken from balance */
  Roe<void> addGenesisValidator(const std::string &address, Amount selfStake,
                                double commission);

private:
  Roe<void> applyStake(StakeIntent intent, const std::string &delegator,
                       const std::string &validator, Amount amount);
  void addRecord(const std::string &delegator, const std::string &validator,
                 Amount amount);
  void refreshActive(Validator &validator);
  Validator *findValidator(const std::string &address);
  Delegation *findDelegation(const std::string &delegator,
                             const std::string &validator);

  Ledger &ledger_;
  Config config_;
  Clock clock_;
  std::vector<Validator> validators_;
  std::map<std::string, size_t> mValidatorIndex_;
  std::map<std::string, std::vector<Delegation>> mDelegations_;
};

} // namespace consensus
} // namespace dpos
