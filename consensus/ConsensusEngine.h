#pragma once

#include "../ledger/Ledger.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "StakingRegistry.h"
#include "Types.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace dpos {
namespace consensus {

/**
 * ConsensusEngine - delegated Proof-of-Stake block producer rotation
 *
 * Selection is a pure function of the block index and the active validator
 * set: a seed in [0,1) picks a point on the cumulative stake line of the
 * active validators in registration order.
 *
 * Also owns the reward policy and splits each block reward between the
 * producer's commission and its delegators, pro rata to stake.
 */
class ConsensusEngine : public Module {
public:
  struct RewardPolicy {
    Amount baseReward{ 10 };
    uint64_t halvingInterval{ 210000 };
    Amount transactionBonus{ 0.1 };   // per included transaction
    Amount maxTransactionBonus{ 5 };
  };

  /** Maps a block index to a value in [0,1) */
  using SeedFunction = std::function<double(uint64_t)>;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NO_ACTIVE_VALIDATORS = 1; // Nobody can produce

  ConsensusEngine(StakingRegistry &staking, Ledger &ledger);
  ~ConsensusEngine() override = default;

  /** Linear congruential seed: ((i * 1103515245 + 12345) mod (2^31 - 1)) / (2^31 - 1) */
  static double lcgSeed(uint64_t blockIndex);

  void setSeedFunction(SeedFunction seed) { seed_ = std::move(seed); }
  void setRewardPolicy(const RewardPolicy &policy) { policy_ = policy; }
  const RewardPolicy &getRewardPolicy() const { return policy_; }

  // ----------------- accessors -------------------------------------
  Roe<std::string> selectValidator(uint64_t blockIndex) const;
  Amount calculateBlockReward(uint64_t blockIndex, size_t transactionCount,
                              Amount totalFees) const;

  // ----------------- methods -------------------------------------
  /**
   * Credits commission to the validator and the remainder to the records
   * backing it. The credited parts always sum to blockReward.
   * @return false for an unknown validator, nothing is credited then
   */
  bool distributeStakingRewards(Amount blockReward,
                                const std::string &validator);

private:
  StakingRegistry &staking_;
  Ledger &ledger_;
  SeedFunction seed_;
  RewardPolicy policy_;
};

} // namespace consensus
} // namespace dpos
