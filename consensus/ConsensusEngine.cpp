#include "ConsensusEngine.h"

#include <algorithm>
#include <cmath>

namespace dpos {
namespace consensus {

ConsensusEngine::ConsensusEngine(StakingRegistry &staking, Ledger &ledger)
    : Module("ConsensusEngine"), staking_(staking), ledger_(ledger),
      seed_(&ConsensusEngine::lcgSeed) {}

double ConsensusEngine::lcgSeed(uint64_t blockIndex) {
  constexpr uint64_t MODULUS = 2147483647ULL;
  uint64_t seed = (blockIndex * 1103515245ULL + 12345ULL) % MODULUS;
  return static_cast<double>(seed) / static_cast<double>(MODULUS);
}

ConsensusEngine::Roe<std::string>
ConsensusEngine::selectValidator(uint64_t blockIndex) const {
  auto active = staking_.getActiveValidators();
  if (active.empty()) {
    return Error(E_NO_ACTIVE_VALIDATORS, "No active validators available");
  }

  Amount totalStake = 0;
  for (const auto &v : active) {
    totalStake += v.totalStake;
  }

  Amount target = seed_(blockIndex) * totalStake;
  Amount cumulative = 0;
  for (const auto &v : active) {
    cumulative += v.totalStake;
    if (cumulative >= target) {
      return v.address;
    }
  }
  return active.front().address;
}

Amount ConsensusEngine::calculateBlockReward(uint64_t blockIndex,
                                             size_t transactionCount,
                                             Amount totalFees) const {
  if (transactionCount == 0) {
    return 0;
  }
  uint64_t halvings =
      policy_.halvingInterval > 0 ? blockIndex / policy_.halvingInterval : 0;
  Amount base = halvings >= 64
                    ? 0
                    : std::ldexp(policy_.baseReward, -static_cast<int>(halvings));
  Amount bonus = std::min(policy_.transactionBonus * transactionCount,
                          policy_.maxTransactionBonus);
  return base + bonus + totalFees;
}

bool ConsensusEngine::distributeStakingRewards(Amount blockReward,
                                               const std::string &validator) {
  auto v = staking_.getValidator(validator);
  if (!v) {
    return false;
  }

  Amount commission = blockReward * v->commission;
  Amount remainder = blockReward - commission;
  ledger_.creditRewards(validator, commission);

  auto records = staking_.getDelegationsTo(validator);
  Amount staked = 0;
  for (const auto &record : records) {
    staked += record.stakedAmount;
  }
  if (staked <= AMOUNT_EPSILON) {
    ledger_.creditRewards(validator, remainder);
    log().debug << "No stake behind " << validator
                << ", remainder credited to validator";
    return true;
  }

  // Last record takes the rounding residue so the shares sum exactly
  Amount distributed = 0;
  for (size_t i = 0; i < records.size(); ++i) {
    Amount share = i + 1 == records.size()
                       ? remainder - distributed
                       : remainder * (records[i].stakedAmount / staked);
    staking_.creditDelegationReward(records[i].delegator, validator, share);
    distributed += share;
  }

  log().debug << "Distributed " << blockReward << " for " << validator
              << ": commission " << commission << ", " << records.size()
              << " delegators";
  return true;
}

} // namespace consensus
} // namespace dpos
