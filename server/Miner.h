#ifndef DPOS_LEDGER_MINER_H
#define DPOS_LEDGER_MINER_H

#include "../lib/Service.h"
#include "Chain.h"

#include <atomic>
#include <cstdint>

namespace dpos {

/**
 * Miner - background block production
 *
 * Polls the chain on its own thread and mines whenever the pool fills a
 * block or the block time has elapsed since the tip. Mining goes through the
 * chain's lock like any other caller.
 */
class Miner : public Service {
public:
  struct Config {
    int64_t pollIntervalMs{ 100 };
    uint32_t maxConsecutiveFailures{ 10 }; // 0 keeps retrying forever
  };

  explicit Miner(Chain &chain);
  ~Miner() override;

  void setConfig(const Config &config) { config_ = config; }
  uint64_t getBlocksMined() const { return blocksMined_; }
  uint32_t getConsecutiveFailures() const { return consecutiveFailures_; }

  /** True once mining failed maxConsecutiveFailures times in a row; the loop then exits */
  bool hasFailed() const;

  /** Mines once if the chain asks for it, returns true when a block was added */
  bool tick();

protected:
  void runLoop() override;

private:
  Chain &chain_;
  Config config_;
  std::atomic<uint64_t> blocksMined_{ 0 };
  std::atomic<uint32_t> consecutiveFailures_{ 0 };
};

} // namespace dpos

#endif // DPOS_LEDGER_MINER_H
