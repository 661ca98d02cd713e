#include "Module.h"
#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

class TestModule : public dpos::Module {
public:
  TestModule(const std::string &name) : dpos::Module(name) {}
};

TEST(ModuleTest, LogReturnsLoggerReference) {
  TestModule module("test_module");

  EXPECT_NO_THROW({
    module.log().info << "Test message";
    module.log().debug << "Debug message";
    module.log().warning << "Warning message";
  });

  EXPECT_EQ(module.log().getName(), "test_module");
  EXPECT_EQ(module.getLoggerName(), "test_module");
}

TEST(ModuleTest, LogIsConst) {
  const TestModule module("const_test");
  EXPECT_NO_THROW({ module.log().info << "Const test message"; });
  EXPECT_EQ(module.log().getName(), "const_test");
}

TEST(ModuleTest, RedirectLoggerMovesUnderOwner) {
  TestModule module("Ledger");
  module.redirectLogger("Chain.Ledger");

  EXPECT_EQ(module.getLoggerName(), "Chain.Ledger");
  EXPECT_EQ(module.log().getParent(), dpos::logging::getLogger("Chain"));
  EXPECT_NO_THROW(module.log().info << "Message via redirect");
}

namespace {

class CountingService : public dpos::Service {
public:
  CountingService() : dpos::Service("CountingService") {}
  ~CountingService() override { stop(); }

  std::atomic<int> iterations{ 0 };
  bool started{ false };
  bool stopped{ false };

protected:
  Roe<void> onStart() override {
    started = true;
    return {};
  }

  void onStop() override { stopped = true; }

  void runLoop() override {
    while (!isStopSet()) {
      iterations++;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
};

class FailingService : public dpos::Service {
public:
  FailingService() : dpos::Service("FailingService") {}

protected:
  Roe<void> onStart() override { return Error(7, "not ready"); }
  void runLoop() override {}
};

} // namespace

TEST(ServiceTest, StartRunsLoopUntilStopped) {
  CountingService service;
  auto result = service.start();
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(service.isRunning());
  EXPECT_TRUE(service.started);

  for (int i = 0; i < 200 && service.iterations == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  service.stop();

  EXPECT_FALSE(service.isRunning());
  EXPECT_TRUE(service.stopped);
  EXPECT_GT(service.iterations.load(), 0);
}

TEST(ServiceTest, StartTwiceFails) {
  CountingService service;
  ASSERT_TRUE(service.start().isOk());
  auto second = service.start();
  EXPECT_TRUE(second.isError());
  service.stop();
}

TEST(ServiceTest, FailedOnStartAbortsStart) {
  FailingService service;
  auto result = service.start();
  ASSERT_TRUE(result.isError());
  EXPECT_NE(result.error().message.find("not ready"), std::string::npos);
  EXPECT_FALSE(service.isRunning());
}

TEST(ServiceTest, StopWhenNotRunningIsHarmless) {
  CountingService service;
  EXPECT_NO_THROW(service.stop());
  EXPECT_FALSE(service.stopped);
}
