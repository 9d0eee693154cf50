#include "app/app_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <json.hpp>
#include <string>

#include "support/test_files.hpp"

namespace imxup {
using json = nlohmann::json;

class AppConfigTests : public ::testing::Test {
 protected:
  std::filesystem::path dir_;
  CredentialCipher      cipher_{"config-test"};

  void                  SetUp() override {
    dir_ = test::MakeScratchDir(::testing::UnitTest::GetInstance()->current_test_info()->name());
  }
  void TearDown() override { std::filesystem::remove_all(dir_); }
};

TEST_F(AppConfigTests, MissingFileGivesDefaultsInItsDirectory) {
  auto config = LoadAppConfig(dir_ / "config.json", cipher_);
  EXPECT_EQ(config.data_dir_, dir_);
  EXPECT_EQ(config.database_path_, dir_ / "imxup.db");
  EXPECT_EQ(config.artifact_dir_, dir_ / "galleries");
  EXPECT_EQ(config.primary_.thumbnail_size_, 3);
  EXPECT_EQ(config.storage_retry_.max_attempts_, 3u);
  EXPECT_EQ(config.network_retry_.base_delay_, std::chrono::milliseconds{1000});
  EXPECT_TRUE(config.hosts_.empty());
}

TEST_F(AppConfigTests, SecretsAreEncryptedOnDisk) {
  auto config                  = AppConfig::Defaults(dir_);
  config.primary_.api_key_     = "api-secret";
  config.primary_.password_    = "web-secret";
  config.primary_.thumbnail_size_ = 5;
  HostSettings host;
  host.enabled_     = true;
  host.trigger_     = HostTrigger::ON_COMPLETED;
  host.credentials_ = "user:host-secret";
  config.hosts_["rapidgator"] = host;
  HookConfig hook;
  hook.event_   = HookEvent::COMPLETED;
  hook.enabled_ = true;
  hook.command_ = "mirror %p";
  config.hooks_.hooks_.push_back(hook);

  auto file = dir_ / "config.json";
  SaveAppConfig(config, file, cipher_);

  std::ifstream in(file);
  std::string   text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(text.find("api-secret"), std::string::npos);
  EXPECT_EQ(text.find("web-secret"), std::string::npos);
  EXPECT_EQ(text.find("host-secret"), std::string::npos);
  EXPECT_NE(text.find("\n    \""), std::string::npos);

  auto loaded = LoadAppConfig(file, cipher_);
  EXPECT_EQ(loaded.primary_.api_key_, "api-secret");
  EXPECT_EQ(loaded.primary_.password_, "web-secret");
  EXPECT_EQ(loaded.primary_.thumbnail_size_, 5);
  ASSERT_TRUE(loaded.hosts_.contains("rapidgator"));
  EXPECT_EQ(loaded.hosts_["rapidgator"].credentials_, "user:host-secret");
  EXPECT_EQ(loaded.hosts_["rapidgator"].trigger_, HostTrigger::ON_COMPLETED);
  ASSERT_EQ(loaded.hooks_.hooks_.size(), 1u);
  EXPECT_EQ(loaded.hooks_.hooks_[0].command_, "mirror %p");
}

TEST_F(AppConfigTests, SecretsFromAnotherMachineAreDropped) {
  auto config              = AppConfig::Defaults(dir_);
  config.primary_.api_key_ = "api-secret";
  SaveAppConfig(config, dir_ / "config.json", cipher_);

  auto loaded = LoadAppConfig(dir_ / "config.json", CredentialCipher{"other-machine"});
  EXPECT_TRUE(loaded.primary_.api_key_.empty());
}

TEST_F(AppConfigTests, RelativePathsResolveAgainstConfigDirectory) {
  json doc = {{"paths", {{"database", "db/queue.db"}, {"artifacts", "/srv/artifacts"}}},
              {"network_retry", {{"max_attempts", 5}, {"base_delay_ms", 250}}}};
  auto config = ParseAppConfig(doc, dir_, cipher_);
  EXPECT_EQ(config.database_path_, dir_ / "db/queue.db");
  EXPECT_EQ(config.artifact_dir_, std::filesystem::path("/srv/artifacts"));
  EXPECT_EQ(config.temp_dir_, dir_ / "tmp");
  EXPECT_EQ(config.network_retry_.max_attempts_, 5u);
  EXPECT_EQ(config.network_retry_.base_delay_, std::chrono::milliseconds{250});
}

TEST_F(AppConfigTests, ProxyAssignmentsAreKept) {
  test::WriteText(dir_ / "config.json", R"({"proxy": {
    "global": "socks5://global:1080",
    "categories": {"primary": "__direct__"},
    "services": {"file_hosts/rapidgator": "http://svc:3128"}}})");
  auto config = LoadAppConfig(dir_ / "config.json", cipher_);
  EXPECT_EQ(config.proxy_.global_, "socks5://global:1080");
  EXPECT_FALSE(config.proxy_.use_os_proxy_);
  EXPECT_EQ(config.proxy_.categories_.at("primary"), "__direct__");

  SaveAppConfig(config, dir_ / "saved.json", cipher_);
  auto saved = LoadAppConfig(dir_ / "saved.json", cipher_);
  EXPECT_EQ(saved.proxy_.services_.at("file_hosts/rapidgator"), "http://svc:3128");

  ProxyResolver resolver{saved.proxy_};
  EXPECT_TRUE(resolver.Resolve(kPrimaryProxyCategory, "imx.to").Direct());
  EXPECT_EQ(resolver.Resolve(kFileHostProxyCategory, "rapidgator").url_, "http://svc:3128");
}

TEST_F(AppConfigTests, InvalidFilesAreReported) {
  test::WriteText(dir_ / "broken.json", "{ not json");
  EXPECT_THROW(LoadAppConfig(dir_ / "broken.json", cipher_), std::runtime_error);

  test::WriteText(dir_ / "thumbs.json", R"({"primary": {"thumbnail_size": 9}})");
  EXPECT_THROW(LoadAppConfig(dir_ / "thumbs.json", cipher_), std::runtime_error);

  test::WriteText(dir_ / "trigger.json", R"({"file_hosts": {"x": {"trigger": "sometimes"}}})");
  EXPECT_THROW(LoadAppConfig(dir_ / "trigger.json", cipher_), std::runtime_error);

  test::WriteText(dir_ / "proxy.json", R"({"proxy": {"categories": ["file_hosts"]}})");
  EXPECT_THROW(LoadAppConfig(dir_ / "proxy.json", cipher_), std::runtime_error);
}
}  // namespace imxup
