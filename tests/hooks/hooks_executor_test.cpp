#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "hooks/hooks_executor.hpp"
#include "support/test_files.hpp"

namespace imxup {
class HooksExecutorTests : public ::testing::Test {
 protected:
  std::filesystem::path    dir_;
  std::filesystem::path    gallery_;
  std::mutex               mtx_;
  std::vector<std::string> commands_;

  void                     SetUp() override {
    dir_     = test::MakeScratchDir("hooks_executor");
    gallery_ = dir_ / "Beach Day";
    std::filesystem::create_directories(gallery_);
    test::WriteFakeJpeg(gallery_ / "001.jpg", 2048);
    test::WriteFakeJpeg(gallery_ / "002.jpg", 1024);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  static auto Hook(HookEvent event, std::string command) -> HookConfig {
    HookConfig hook;
    hook.event_   = event;
    hook.enabled_ = true;
    hook.command_ = std::move(command);
    return hook;
  }

  static auto Output(int exit_code, std::string out) -> ProcessResult {
    ProcessResult result;
    result.exit_code_ = exit_code;
    result.stdout_    = std::move(out);
    return result;
  }

  /**
   * @brief Runner answering by command prefix and recording every command line
   */
  auto Runner(std::vector<std::pair<std::string, ProcessResult>> answers) -> CommandRunner {
    return [this, answers](const std::string& command, std::chrono::milliseconds) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        commands_.push_back(command);
      }
      for (const auto& [prefix, result] : answers) {
        if (command.starts_with(prefix)) return result;
      }
      return Output(0, "");
    };
  }

  auto Context() -> HookContext {
    HookContext context;
    context.gallery_name_  = "Beach Day";
    context.gallery_path_  = gallery_;
    context.image_count_   = 2;
    context.size_bytes_    = 3072;
    context.template_name_ = "Forum";
    context.gallery_id_    = "g8x2";
    return context;
  }
};

TEST_F(HooksExecutorTests, SubstitutesLongestTokenFirst) {
  auto context    = Context();
  context.ext_[0] = "E1";
  context.custom_ = {"C1", "", "", "C4"};
  EXPECT_EQ(HooksExecutor::Substitute("%e1|%e|%c4|%c2|%c5", context), "E1|%e|C4||%c5");
  EXPECT_EQ(HooksExecutor::Substitute("up \"%N\" %C %s %t %T %g", context),
            "up \"Beach Day\" 2 3072 Forum Main g8x2");
  EXPECT_EQ(HooksExecutor::Substitute("a%jb%zc", context), "abc");
  EXPECT_EQ(HooksExecutor::Substitute("100% done %", context), "100% done %");
}

TEST_F(HooksExecutorTests, SubstitutedValuesAreNotExpandedAgain) {
  auto context          = Context();
  context.gallery_name_ = "50%N off %e1";
  context.ext_[0]       = "X";
  EXPECT_EQ(HooksExecutor::Substitute("[%N] [%e1]", context), "[50%N off %e1] [X]");
}

TEST_F(HooksExecutorTests, MapsJsonOutputIntoExtFields) {
  HooksConfig config;
  auto        hook    = Hook(HookEvent::COMPLETED, "mirror %p");
  hook.key_mapping_   = {"download_url", "", "size", "missing"};
  config.hooks_       = {hook};
  HooksExecutor executor{config, dir_,
                         Runner({{"mirror", Output(0, R"({"download_url":"https://x/1","size":42})")}})};

  auto          outcome = executor.Execute(HookEvent::COMPLETED, Context());
  EXPECT_TRUE(outcome.success_);
  EXPECT_EQ(outcome.executed_, 1u);
  EXPECT_EQ(outcome.ext_[0].value_or(""), "https://x/1");
  EXPECT_FALSE(outcome.ext_[1].has_value());
  EXPECT_EQ(outcome.ext_[2].value_or(""), "42");
  EXPECT_FALSE(outcome.ext_[3].has_value());
  ASSERT_EQ(commands_.size(), 1u);
  EXPECT_EQ(commands_[0], "mirror " + gallery_.string());
}

TEST_F(HooksExecutorTests, OnlyHooksOfTheEventRun) {
  HooksConfig config;
  auto        disabled = Hook(HookEvent::COMPLETED, "never");
  disabled.enabled_    = false;
  config.hooks_        = {Hook(HookEvent::ADDED, "added"), disabled,
                          Hook(HookEvent::COMPLETED, "   ")};
  HooksExecutor executor{config, dir_, Runner({})};
  EXPECT_EQ(executor.Execute(HookEvent::COMPLETED, Context()).executed_, 0u);
  EXPECT_EQ(executor.Execute(HookEvent::ADDED, Context()).executed_, 1u);
  EXPECT_EQ(commands_, std::vector<std::string>{"added"});
}

TEST_F(HooksExecutorTests, MalformedOutputIsIgnored) {
  HooksConfig config;
  config.hooks_ = {Hook(HookEvent::STARTED, "noisy")};
  HooksExecutor executor{config, dir_, Runner({{"noisy", Output(0, "{not json")}})};
  auto          outcome = executor.Execute(HookEvent::STARTED, Context());
  EXPECT_TRUE(outcome.success_);
  EXPECT_TRUE(outcome.failures_.empty());
  EXPECT_FALSE(outcome.AnyExt());
}

TEST_F(HooksExecutorTests, OnlyRequiredFailuresFailTheGallery) {
  HooksConfig config;
  config.parallel_execution_ = false;
  config.hooks_              = {Hook(HookEvent::COMPLETED, "optional")};
  HooksExecutor optional{config, dir_, Runner({{"optional", Output(2, "")}})};
  auto          soft = optional.Execute(HookEvent::COMPLETED, Context());
  EXPECT_TRUE(soft.success_);
  EXPECT_EQ(soft.failures_.size(), 1u);

  config.hooks_[0].required_ = true;
  HooksExecutor required{config, dir_, Runner({{"optional", Output(2, "")}})};
  EXPECT_FALSE(required.Execute(HookEvent::COMPLETED, Context()).success_);
}

TEST_F(HooksExecutorTests, TimeoutIsAFailure) {
  HooksConfig config;
  auto        hook = Hook(HookEvent::COMPLETED, "slow");
  hook.required_   = true;
  hook.timeout_    = std::chrono::seconds{7};
  config.hooks_    = {hook};
  std::chrono::milliseconds seen{0};
  HooksExecutor executor{config, dir_, [&](const std::string&, std::chrono::milliseconds timeout) {
                           seen = timeout;
                           ProcessResult result;
                           result.timed_out_ = true;
                           return result;
                         }};
  auto outcome = executor.Execute(HookEvent::COMPLETED, Context());
  EXPECT_FALSE(outcome.success_);
  EXPECT_EQ(seen, std::chrono::milliseconds{7000});
  ASSERT_EQ(outcome.failures_.size(), 1u);
  EXPECT_NE(outcome.failures_[0].find("timed out"), std::string::npos);
}

TEST_F(HooksExecutorTests, SequentialHooksSeeEarlierExtValues) {
  HooksConfig config;
  config.parallel_execution_ = false;
  auto first                 = Hook(HookEvent::COMPLETED, "first");
  first.key_mapping_         = {"url", "", "", ""};
  auto second                = Hook(HookEvent::COMPLETED, "second %e1");
  second.key_mapping_        = {"url", "", "", ""};
  config.hooks_              = {first, second};
  HooksExecutor executor{config, dir_,
                         Runner({{"first", Output(0, R"({"url":"u1"})")},
                                 {"second", Output(0, R"({"url":"u2"})")}})};

  auto          outcome = executor.Execute(HookEvent::COMPLETED, Context());
  ASSERT_EQ(commands_.size(), 2u);
  EXPECT_EQ(commands_[1], "second u1");
  EXPECT_EQ(outcome.ext_[0].value_or(""), "u2");
}

TEST_F(HooksExecutorTests, ParallelHooksFirstConfiguredWins) {
  HooksConfig config;
  config.parallel_execution_ = true;
  auto first                 = Hook(HookEvent::COMPLETED, "first");
  first.key_mapping_         = {"url", "", "", ""};
  auto second                = Hook(HookEvent::COMPLETED, "second");
  second.key_mapping_        = {"url", "id", "", ""};
  config.hooks_              = {first, second};
  HooksExecutor executor{config, dir_,
                         Runner({{"first", Output(0, R"({"url":"u1"})")},
                                 {"second", Output(0, R"({"url":"u2","id":7})")}})};

  auto          outcome = executor.Execute(HookEvent::COMPLETED, Context());
  EXPECT_EQ(outcome.executed_, 2u);
  EXPECT_EQ(outcome.ext_[0].value_or(""), "u1");
  EXPECT_EQ(outcome.ext_[1].value_or(""), "7");
}

TEST_F(HooksExecutorTests, TemporaryArchiveIsRemovedAfterTheHook) {
  HooksConfig config;
  config.hooks_ = {Hook(HookEvent::COMPLETED, "send %z")};
  std::filesystem::path archive;
  bool                  looked_valid = false;
  HooksExecutor executor{config, dir_ / "tmp", [&](const std::string& command, std::chrono::milliseconds) {
                           archive = command.substr(5);
                           std::ifstream in(archive, std::ios::binary);
                           char          magic[2] = {};
                           in.read(magic, 2);
                           looked_valid = in && magic[0] == 'P' && magic[1] == 'K';
                           return Output(1, "");
                         }};

  auto outcome = executor.Execute(HookEvent::COMPLETED, Context());
  EXPECT_EQ(outcome.failures_.size(), 1u);
  EXPECT_TRUE(looked_valid);
  EXPECT_EQ(archive.filename(), "Beach Day.zip");
  EXPECT_FALSE(std::filesystem::exists(archive));
}

TEST_F(HooksExecutorTests, ExistingArchiveIsPassedThrough) {
  HooksConfig config;
  config.hooks_ = {Hook(HookEvent::COMPLETED, "send %z")};
  HooksExecutor executor{config, dir_, Runner({})};
  auto          context = Context();
  context.zip_path_     = dir_ / "prebuilt.zip";
  executor.Execute(HookEvent::COMPLETED, context);
  ASSERT_EQ(commands_.size(), 1u);
  EXPECT_EQ(commands_[0], "send " + (dir_ / "prebuilt.zip").string());
}

TEST(HooksConfigTest, ParsesHookList) {
  auto config = ParseHooksConfig(nlohmann::json::parse(R"({
    "parallel_execution": false,
    "hooks": [
      {"event": "completed", "command": "up %z", "timeout": 60, "required": true,
       "key_mapping": {"ext1": " link ", "ext4": ""}},
      {"event": "added", "command": "notify %N", "enabled": false}
    ]})"));
  EXPECT_FALSE(config.parallel_execution_);
  ASSERT_EQ(config.hooks_.size(), 2u);
  EXPECT_EQ(config.hooks_[0].timeout_, std::chrono::seconds{60});
  EXPECT_TRUE(config.hooks_[0].required_);
  EXPECT_EQ(config.hooks_[0].key_mapping_[0], "link");
  EXPECT_EQ(config.hooks_[0].key_mapping_[1], "ext2");
  EXPECT_EQ(config.hooks_[0].key_mapping_[3], "");
  EXPECT_EQ(config.ForEvent(HookEvent::ADDED).size(), 0u);
  EXPECT_EQ(ParseHooksConfig(ToJson(config)).hooks_.size(), 2u);

  EXPECT_THROW(ParseHooksConfig(nlohmann::json::parse(R"({"hooks":[{"event":"deleted"}]})")),
               std::runtime_error);
}
}  // namespace imxup
