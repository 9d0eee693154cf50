#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <thread>

#include "hooks/process_runner.hpp"
#include "support/test_files.hpp"

namespace imxup {
using namespace std::chrono_literals;

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
  auto result = RunShellCommand("echo out; echo err 1>&2; exit 3", 5000ms);
  EXPECT_FALSE(result.timed_out_);
  EXPECT_EQ(result.exit_code_, 3);
  EXPECT_EQ(result.stdout_, "out\n");
  EXPECT_EQ(result.stderr_, "err\n");
  EXPECT_FALSE(result.Succeeded());

  EXPECT_TRUE(RunShellCommand("true", 5000ms).Succeeded());
}

TEST(ProcessRunnerTest, CommandSeesShellQuoting) {
  auto result = RunShellCommand(R"(printf '%s|' "a b" c)", 5000ms);
  EXPECT_EQ(result.stdout_, "a b|c|");
}

TEST(ProcessRunnerTest, TimeoutKillsTheWholeGroup) {
  auto dir    = test::MakeScratchDir("process_runner");
  auto marker = dir / "survived";
  auto start  = std::chrono::steady_clock::now();
  // The background child would create the marker if it outlived the kill
  auto result = RunShellCommand("(sleep 2; touch '" + marker.string() + "') & sleep 30", 300ms);
  auto took   = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out_);
  EXPECT_EQ(result.exit_code_, -1);
  EXPECT_LT(took, 5s);

  std::this_thread::sleep_for(2500ms);
  EXPECT_FALSE(std::filesystem::exists(marker));
  std::filesystem::remove_all(dir);
}

TEST(ProcessRunnerTest, TimeoutHoldsWhenCommandClosesItsOutput) {
  auto start  = std::chrono::steady_clock::now();
  auto result = RunShellCommand("exec sleep 4 >/dev/null 2>&1", 500ms);
  auto took   = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out_);
  EXPECT_FALSE(result.Succeeded());
  EXPECT_LT(took, 3s);
}
}  // namespace imxup
