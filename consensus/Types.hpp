#pragma once

#include "../ledger/Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace dpos {
namespace consensus {

struct Validator {
  std::string address;
  Amount selfStake{ 0 };
  Amount totalStake{ 0 }; // self + delegated
  Amount commission{ 0 }; // fraction of the block reward kept
  bool isActive{ false };
  uint64_t blocksProduced{ 0 };
  uint64_t lastActiveBlock{ 0 };

  nlohmann::json toJson() const {
    return {{"address", address},
            {"selfStake", selfStake},
            {"totalStake", totalStake},
            {"commission", commission},
            {"isActive", isActive},
            {"blocksProduced", blocksProduced},
            {"lastActiveBlock", lastActiveBlock}};
  }
};

struct Delegation {
  std::string delegator;
  std::string validator;
  Amount stakedAmount{ 0 };
  Amount rewards{ 0 };
  Amount pendingRelease{ 0 };          // unstaked, waiting for maturity
  std::optional<int64_t> maturityTime; // unix ms when pendingRelease unlocks

  nlohmann::json toJson() const {
    nlohmann::json j = {{"delegator", delegator},
                        {"validator", validator},
                        {"stakedAmount", stakedAmount},
                        {"rewards", rewards},
                        {"pendingRelease", pendingRelease}};
    j["maturityTime"] = maturityTime ? nlohmann::json(*maturityTime)
                                     : nlohmann::json(nullptr);
    return j;
  }
};

// A stake either nominates its sender as validator or backs another one
enum class StakeIntent { SELF_NOMINATION, DELEGATION };

} // namespace consensus
} // namespace dpos
