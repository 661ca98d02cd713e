#include "Logger.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

class CaptureHandler : public dpos::logging::Handler {
public:
  void emit(dpos::logging::Level level, const std::string &message) override {
    if (level < level_) {
      return;
    }
    messages.push_back(message);
  }

  std::vector<std::string> messages;
};

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
  auto rootLogger = dpos::logging::getRootLogger();
  EXPECT_NO_THROW({
    rootLogger.debug << "Debug message";
    rootLogger.info << "Info message";
    rootLogger.warning << "Warning message";
    rootLogger.error << "Error message";
    rootLogger.critical << "Critical message";
  });
  EXPECT_EQ(rootLogger.getFullName(), "");
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
  auto namedLogger = dpos::logging::getLogger("myapp");
  EXPECT_EQ(namedLogger.getName(), "myapp");
  EXPECT_EQ(namedLogger.getFullName(), "myapp");

  auto child = dpos::logging::getLogger("myapp.ledger");
  EXPECT_EQ(child.getName(), "ledger");
  EXPECT_EQ(child.getFullName(), "myapp.ledger");
}

TEST(LoggerTest, SameNameSharesNode) {
  auto a = dpos::logging::getLogger("shared_node");
  auto b = dpos::logging::getLogger("shared_node");
  EXPECT_EQ(a, b);

  a.setLevel(dpos::logging::Level::ERROR);
  EXPECT_EQ(b.getLevel(), dpos::logging::Level::ERROR);
}

TEST(LoggerTest, LevelFiltersMessages) {
  auto logger = dpos::logging::getLogger("level_test");
  auto spCapture = std::make_shared<CaptureHandler>();
  logger.addHandler(spCapture);
  logger.setPropagate(false);
  logger.setLevel(dpos::logging::Level::WARNING);

  logger.debug << "hidden";
  logger.info << "hidden";
  logger.warning << "shown " << 1;
  logger.error << "shown " << 2;

  ASSERT_EQ(spCapture->messages.size(), 2u);
  EXPECT_NE(spCapture->messages[0].find("[WARNING] [level_test] shown 1"),
            std::string::npos);
  EXPECT_NE(spCapture->messages[1].find("[ERROR]"), std::string::npos);
}

TEST(LoggerTest, ChildInheritsParentLevel) {
  auto parent = dpos::logging::getLogger("inherit");
  auto child = dpos::logging::getLogger("inherit.child");
  parent.setLevel(dpos::logging::Level::ERROR);
  EXPECT_EQ(child.getLevel(), dpos::logging::Level::ERROR);

  child.setLevel(dpos::logging::Level::DEBUG);
  EXPECT_EQ(child.getLevel(), dpos::logging::Level::DEBUG);
  EXPECT_EQ(parent.getLevel(), dpos::logging::Level::ERROR);
}

TEST(LoggerTest, HierarchicalLoggerCreatesTree) {
  auto root = dpos::logging::getRootLogger();
  auto chain = dpos::logging::getLogger("tree");
  auto ledger = dpos::logging::getLogger("tree.Ledger");
  auto staking = dpos::logging::getLogger("tree.Staking");

  EXPECT_EQ(chain.getParent(), root);
  EXPECT_EQ(ledger.getParent(), chain);
  EXPECT_EQ(staking.getParent(), chain);
}

TEST(LoggerTest, DeepNameCreatesAncestors) {
  auto deep = dpos::logging::getLogger("a1.b1.c1");
  auto middle = dpos::logging::getLogger("a1.b1");
  EXPECT_EQ(deep.getParent(), middle);
  EXPECT_EQ(middle.getParent().getFullName(), "a1");
}

TEST(LoggerTest, LogPropagationInTree) {
  auto parent = dpos::logging::getLogger("prop");
  auto child = dpos::logging::getLogger("prop.child");
  parent.setPropagate(false);
  parent.setLevel(dpos::logging::Level::DEBUG);

  auto spParentCapture = std::make_shared<CaptureHandler>();
  auto spChildCapture = std::make_shared<CaptureHandler>();
  parent.addHandler(spParentCapture);
  child.addHandler(spChildCapture);

  EXPECT_TRUE(child.getPropagate());
  child.info << "to both";
  EXPECT_EQ(spChildCapture->messages.size(), 1u);
  EXPECT_EQ(spParentCapture->messages.size(), 1u);
  EXPECT_NE(spParentCapture->messages[0].find("[prop.child]"), std::string::npos);

  child.setPropagate(false);
  EXPECT_FALSE(child.getPropagate());
  child.info << "child only";
  EXPECT_EQ(spChildCapture->messages.size(), 2u);
  EXPECT_EQ(spParentCapture->messages.size(), 1u);
}

TEST(LoggerTest, CopiedLoggerLogsToSameNode) {
  auto original = dpos::logging::getLogger("copy_test");
  original.setPropagate(false);
  auto spCapture = std::make_shared<CaptureHandler>();
  original.addHandler(spCapture);

  dpos::logging::Logger copy(original);
  copy.info << "from copy";

  dpos::logging::Logger assigned = dpos::logging::getLogger("other_copy_test");
  assigned = original;
  assigned.info << "from assigned";

  EXPECT_EQ(spCapture->messages.size(), 2u);
}

TEST(LoggerTest, FileHandlerWritesMessages) {
  std::string path = (std::filesystem::temp_directory_path() /
                      "dpos-ledger-logger-test.log")
                         .string();
  std::filesystem::remove(path);

  auto fileLogger = dpos::logging::getLogger("file_test");
  fileLogger.setPropagate(false);
  fileLogger.setLevel(dpos::logging::Level::DEBUG);
  ASSERT_NO_THROW(fileLogger.addFileHandler(path, dpos::logging::Level::INFO));

  fileLogger.debug << "not written";
  fileLogger.info << "written to file";

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("written to file"), std::string::npos);
  EXPECT_EQ(content.find("not written"), std::string::npos);
  std::filesystem::remove(path);
}

TEST(LoggerTest, LevelFromString) {
  using dpos::logging::Level;
  EXPECT_EQ(dpos::logging::levelFromString("debug"), Level::DEBUG);
  EXPECT_EQ(dpos::logging::levelFromString("WARNING"), Level::WARNING);
  EXPECT_EQ(dpos::logging::levelFromString("error"), Level::ERROR);
  EXPECT_EQ(dpos::logging::levelFromString("critical"), Level::CRITICAL);
  EXPECT_EQ(dpos::logging::levelFromString("bogus"), Level::INFO);
  EXPECT_EQ(dpos::logging::levelToString(Level::WARNING), "WARNING");
}
