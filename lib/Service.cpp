#include "Service.h"

namespace dpos {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  // Derived parts are already destroyed here, subclasses stop in their dtor
  if (thread_.joinable()) {
    isStopSet_ = true;
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (isRunning_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (!isRunning_) {
    log().debug << "Service is not running";
    return;
  }

  log().info << "Stopping service";

  isStopSet_ = true;

  if (thread_.joinable()) {
    thread_.join();
  }
  isRunning_ = false;

  onStop();

  log().info << "Service stopped";
}

Service::Roe<void> Service::run() {
  if (isRunning_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  log().info << "Service running in current thread";
  runLoop();
  isRunning_ = false;
  onStop();
  log().info << "Service stopped (current thread)";
  return {};
}

} // namespace dpos
