#pragma once

#include "Module.h"
#include "ResultOrError.hpp"

#include <atomic>
#include <thread>

namespace dpos {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread or in the current thread when using run().
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name);

  /**
   * Stops the service if running
   */
  ~Service() override;

  bool isRunning() const { return isRunning_; }
  bool isStopSet() const { return isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the loop starts, in the calling thread.
   * An error aborts the start.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the loop has ended, in the calling thread.
   */
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ false };
  std::atomic<bool> isRunning_{ false };
  std::thread thread_;
};

} // namespace dpos
