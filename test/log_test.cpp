#include "ytree/loader.h"
#include "ytree/log.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace YTree {
namespace {
class CapturingListener : public logs::listener {
 public:
  void log(const logs::message& msg, const std::string& text) override {
    levels.push_back(msg.sev);
    texts.push_back(text);
  }

  std::vector<logs::level> levels;
  std::vector<std::string> texts;
};

class LogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    logs::reset();
    logs::listener::add(&listener);
  }

  void TearDown() override {
    logs::listener::remove(&listener);
    logs::reset();
  }

  CapturingListener listener;
};

LoadOptions FirstWins() {
  LoadOptions options;
  options.composer.duplicateKeys = DuplicateKeyPolicy::FirstWins;
  return options;
}

TEST_F(LogTest, DuplicateKeyWarning) {
  Load("a: 1\na: 2\n", FirstWins());

  ASSERT_EQ(1u, listener.texts.size());
  EXPECT_EQ(logs::level::warning, listener.levels[0]);
  EXPECT_EQ("duplicate key 'a' at line 2, column 1: keeping the first value", listener.texts[0]);
}

TEST_F(LogTest, UnknownDirectiveWarning) {
  Load("%FOO bar\n--- a\n");

  ASSERT_EQ(1u, listener.texts.size());
  EXPECT_EQ("ignoring unknown directive %FOO at line 1", listener.texts[0]);
}

TEST_F(LogTest, SilenceDropsMessages) {
  logs::silence();
  Load("a: 1\na: 2\n", FirstWins());

  EXPECT_TRUE(listener.texts.empty());
  EXPECT_EQ(logs::level::always, logs::get_level());
}

TEST_F(LogTest, TraceIsOffByDefault) {
  Load("- a\n- b\n");
  EXPECT_TRUE(listener.texts.empty());

  logs::set_level(logs::level::trace);
  Load("- a\n- b\n");
  EXPECT_FALSE(listener.texts.empty());
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ("W", logs::level_name(logs::level::warning));
  EXPECT_STREQ("T", logs::level_name(logs::level::trace));
}
}  // namespace
}  // namespace YTree
