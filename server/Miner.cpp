#include "Miner.h"

#include <chrono>
#include <thread>

namespace dpos {

Miner::Miner(Chain &chain) : Service("Miner"), chain_(chain) {}

Miner::~Miner() { stop(); }

bool Miner::hasFailed() const {
  return config_.maxConsecutiveFailures > 0 &&
         consecutiveFailures_ >= config_.maxConsecutiveFailures;
}

bool Miner::tick() {
  if (!chain_.shouldAutoMine()) {
    return false;
  }
  auto result = chain_.mineBlock();
  if (!result) {
    consecutiveFailures_++;
    log().error << "Mining failed (" << consecutiveFailures_ << " in a row): "
                << result.error().message;
    return false;
  }
  consecutiveFailures_ = 0;
  if (!result.value()) {
    return false;
  }
  blocksMined_++;
  return true;
}

void Miner::runLoop() {
  while (!isStopSet()) {
    tick();
    if (hasFailed()) {
      log().critical << "Giving up after " << consecutiveFailures_
                     << " consecutive mining failures";
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.pollIntervalMs));
  }
}

} // namespace dpos
