#include "app/upload_coordinator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "support/fake_file_host_client.hpp"
#include "support/fake_primary_host_client.hpp"
#include "support/fake_transport.hpp"
#include "support/test_files.hpp"

namespace imxup {
using json = nlohmann::json;

class UploadCoordinatorTests : public ::testing::Test {
 protected:
  std::filesystem::path                   root_;
  AppConfig                               config_;
  // Every transport the coordinator asked for, in creation order
  std::mutex                              transports_mutex_;
  std::vector<test::FakeTransport*>       transports_;
  std::function<void(test::FakeTransport&)> routes_;
  test::FakePrimaryHostClient*            primary_   = nullptr;
  std::shared_ptr<test::FakeHostState>    host_state_ = std::make_shared<test::FakeHostState>();
  std::mutex                              commands_mutex_;
  std::vector<std::string>                commands_;
  ProcessResult                           hook_answer_;
  std::unique_ptr<UploadCoordinator>      coordinator_;

  void                                    SetUp() override {
    root_   = test::MakeScratchDir(::testing::UnitTest::GetInstance()->current_test_info()->name());
    config_ = AppConfig::Defaults(root_ / "data");
    config_.primary_.parallel_batch_size_ = 2;
    config_.primary_.retry_passes_        = 1;

    std::filesystem::create_directories(config_.hosts_dir_);
    json host = {{"name", "Test Host"},
                 {"requires_auth", false},
                 {"upload", {{"endpoint", "https://up.test/upload"}, {"file_field", "file"}}},
                 {"response", {{"type", "json"}, {"link_path", "url"}}}};
    test::WriteText(config_.hosts_dir_ / "testhost.json", host.dump());

    hook_answer_.exit_code_ = 0;
    hook_answer_.stdout_    = R"({"ext1":"https://mirror.test/1"})";
  }

  void TearDown() override {
    coordinator_.reset();
    std::filesystem::remove_all(root_);
  }

  void Launch(bool fake_hosts = true) {
    auto primary = std::make_unique<test::FakePrimaryHostClient>();
    primary_     = primary.get();
    auto state   = host_state_;
    FileHostClientFactory hosts;
    if (fake_hosts) {
      hosts = [state](const HostConfig&, const HostSettings&) {
        return std::make_unique<test::FakeFileHostClient>(state);
      };
    }
    coordinator_ = std::make_unique<UploadCoordinator>(
        config_, CredentialCipher{"coordinator-test"},
        [this]() -> std::unique_ptr<HttpTransport> {
          auto transport = std::make_unique<test::FakeTransport>();
          if (routes_) routes_(*transport);
          std::lock_guard<std::mutex> lock(transports_mutex_);
          transports_.push_back(transport.get());
          return transport;
        },
        std::move(primary), std::move(hosts),
        [this](const std::string& command, std::chrono::milliseconds) {
          std::lock_guard<std::mutex> lock(commands_mutex_);
          commands_.push_back(command);
          return hook_answer_;
        });
    coordinator_->Start();
  }

  void AddHook(HookEvent event, const std::string& command, bool required = false) {
    HookConfig hook;
    hook.event_    = event;
    hook.enabled_  = true;
    hook.command_  = command;
    hook.required_ = required;
    config_.hooks_.hooks_.push_back(hook);
  }

  void EnableHost(HostTrigger trigger) {
    HostSettings settings;
    settings.enabled_          = true;
    settings.trigger_          = trigger;
    config_.hosts_["testhost"] = settings;
  }

  auto MakeFolder(const std::string& name, int count) -> std::filesystem::path {
    auto folder = root_ / name;
    std::filesystem::create_directories(folder);
    for (int i = 1; i <= count; ++i) {
      test::WriteFakeJpeg(folder / ("img" + std::to_string(i) + ".jpg"), 1000);
    }
    return folder;
  }

  auto Commands() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(commands_mutex_);
    return commands_;
  }
};

TEST_F(UploadCoordinatorTests, GalleryGoesFromFolderToMirroredArchive) {
  AddHook(HookEvent::COMPLETED, "mirror %j");
  EnableHost(HostTrigger::ON_COMPLETED);
  Launch();

  auto id = coordinator_->AddGallery(MakeFolder("Summer", 3), "Summer Trip");
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));

  auto gallery = coordinator_->Queue().Get(*id);
  ASSERT_TRUE(gallery.has_value());
  EXPECT_EQ(gallery->state_, GalleryState::COMPLETED);
  EXPECT_EQ(gallery->uploaded_images_, 3);
  EXPECT_EQ(gallery->host_gallery_id_, "G1");
  EXPECT_EQ(gallery->ext_[0], "https://mirror.test/1");

  auto artifact = config_.artifact_dir_ / "Summer Trip_G1.json";
  EXPECT_TRUE(std::filesystem::exists(artifact));
  auto commands = Commands();
  ASSERT_EQ(commands.size(), 1u);
  EXPECT_EQ(commands[0], "mirror " + artifact.string());

  auto jobs = coordinator_->Queue().GetHostUploads(HostUploadFilter{.gallery_id_ = *id});
  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_EQ(jobs[0].host_id_, "testhost");
  EXPECT_EQ(jobs[0].state_, HostUploadState::COMPLETED);
  EXPECT_EQ(host_state_->uploads_.load(), 1);

  // No web login is configured, so the rename waits for a later session
  coordinator_->Stop();
  auto unnamed = coordinator_->Queue().GetUnnamed();
  ASSERT_EQ(unnamed.size(), 1u);
  EXPECT_EQ(unnamed[0].host_gallery_id_, "G1");
  EXPECT_EQ(unnamed[0].intended_name_, "Summer Trip");
}

TEST_F(UploadCoordinatorTests, AddedTriggerMirrorsBeforeUpload) {
  EnableHost(HostTrigger::ON_ADDED);
  Launch();

  auto id = coordinator_->AddGallery(MakeFolder("early", 2));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));

  auto gallery = coordinator_->Queue().Get(*id);
  EXPECT_EQ(gallery->name_, "early");
  EXPECT_EQ(gallery->state_, GalleryState::COMPLETED);
  auto jobs = coordinator_->Queue().GetHostUploads(HostUploadFilter{.gallery_id_ = *id});
  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_EQ(jobs[0].state_, HostUploadState::COMPLETED);
}

TEST_F(UploadCoordinatorTests, FailedRequiredStartHookFailsGallery) {
  AddHook(HookEvent::STARTED, "check %p", true);
  hook_answer_.exit_code_ = 3;
  hook_answer_.stdout_.clear();
  Launch();

  auto id = coordinator_->AddGallery(MakeFolder("guarded", 2));
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));

  auto gallery = coordinator_->Queue().Get(*id);
  EXPECT_EQ(gallery->state_, GalleryState::FAILED);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::HOOK);
  EXPECT_TRUE(primary_->Attempts().empty());
}

TEST_F(UploadCoordinatorTests, FolderWithoutImagesStaysInValidation) {
  Launch();
  auto folder = root_ / "empty";
  std::filesystem::create_directories(folder);
  test::WriteText(folder / "notes.txt", "nothing to see");

  auto id = coordinator_->AddGallery(folder);
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));

  auto gallery = coordinator_->Queue().Get(*id);
  EXPECT_EQ(gallery->state_, GalleryState::VALIDATING);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::VALIDATION);
  EXPECT_FALSE(coordinator_->AddGallery(folder).has_value());
}

TEST_F(UploadCoordinatorTests, ManualStartWaitsForTheCaller) {
  Launch();
  auto id = coordinator_->AddGallery(MakeFolder("manual", 1), "", false);
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));
  EXPECT_EQ(coordinator_->Queue().Get(*id)->state_, GalleryState::READY);

  EXPECT_EQ(coordinator_->StartGallery(*id), TransitionStatus::OK);
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));
  EXPECT_EQ(coordinator_->Queue().Get(*id)->state_, GalleryState::COMPLETED);
  EXPECT_EQ(coordinator_->StartGallery(*id), TransitionStatus::CONFLICT);
}

TEST_F(UploadCoordinatorTests, DisabledHostShowsAsPlaceholder) {
  Launch();
  auto entry = coordinator_->Status().Get(FileHostWorkerId("testhost"));
  ASSERT_TRUE(entry.has_value());
  EXPECT_TRUE(IsPlaceholder(*entry));
  EXPECT_TRUE(coordinator_->Status().Contains(kPrimaryWorkerId));
  EXPECT_TRUE(coordinator_->Status().Contains(kRenameWorkerId));
}
TEST_F(UploadCoordinatorTests, HostReloginLeavesWebSessionAlone) {
  config_.primary_.web_url_ = "https://imx.test";
  config_.cookie_file_      = root_ / "cookies.txt";
  test::WriteText(config_.cookie_file_, "imx.test\tFALSE\t/\tFALSE\t0\tPHPSESSID\tweb-session\n");

  json host = {{"name", "Session Host"},
               {"requires_auth", true},
               {"auth_type", "session"},
               {"auth",
                {{"login_url", "https://up.test/login"},
                 {"login_fields", {{"login", "{username}"}, {"password", "{password}"}}}}},
               {"upload", {{"endpoint", "https://up.test/upload"}, {"file_field", "file"}}},
               {"response", {{"type", "json"}, {"link_path", "url"}}}};
  test::WriteText(config_.hosts_dir_ / "testhost.json", host.dump());
  EnableHost(HostTrigger::ON_COMPLETED);
  config_.hosts_["testhost"].credentials_ = "user:secret";

  routes_ = [](test::FakeTransport& transport) {
    using test::FakeTransport;
    transport.On(HttpMethod::GET, "https://imx.test/user/gallery/", FakeTransport::Respond(200, "ok"));
    transport.On(HttpMethod::POST, "https://imx.test/user/gallery/edit",
                 FakeTransport::Respond(200, "ok"));
    transport.On(HttpMethod::GET, "https://up.test/login", FakeTransport::Respond(200, "<form>"));
    auto* jar = &transport;
    transport.On(HttpMethod::POST, "https://up.test/login",
                 [jar](const HttpRequest& request, const TransferControl&) {
                   jar->SetCookie("up.test", "xfss", "host-session");
                   HttpResponse response;
                   response.status_    = 200;
                   response.final_url_ = request.url_;
                   return response;
                 });
    // The first upload finds the session expired
    transport.On(HttpMethod::POST, "https://up.test/upload", FakeTransport::Respond(401, "expired"));
    transport.On(HttpMethod::POST, "https://up.test/upload",
                 FakeTransport::Respond(200, R"({"url":"https://up.test/f/1"})"));
  };
  Launch(false);

  auto id = coordinator_->AddGallery(MakeFolder("session", 2), "Session Trip");
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));
  coordinator_->Stop();

  auto jobs = coordinator_->Queue().GetHostUploads(HostUploadFilter{.gallery_id_ = *id});
  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_EQ(jobs[0].state_, HostUploadState::COMPLETED);
  EXPECT_EQ(jobs[0].download_url_, "https://up.test/f/1");
  EXPECT_TRUE(coordinator_->Queue().GetUnnamed().empty());

  std::lock_guard<std::mutex> lock(transports_mutex_);
  size_t logins       = 0;
  size_t web_sessions = 0;
  for (auto* transport : transports_) {
    logins += transport->Count(HttpMethod::POST, "https://up.test/login");
    auto cookies = transport->Cookies();
    if (cookies.count("PHPSESSID") == 1) {
      ++web_sessions;
      EXPECT_EQ(cookies["PHPSESSID"], "web-session");
      EXPECT_EQ(cookies.count("xfss"), 0u);
    }
  }
  // Spin-up login plus the re-login after the rejected upload
  EXPECT_EQ(logins, 2u);
  EXPECT_EQ(web_sessions, 1u);
}

TEST_F(UploadCoordinatorTests, HostTrafficTakesItsAssignedProxy) {
  config_.primary_.web_url_                          = "https://imx.test";
  config_.proxy_.global_                             = "http://global.test:3128";
  config_.proxy_.categories_["primary"]              = "__direct__";
  config_.proxy_.services_["file_hosts/testhost"]    = "socks5://hostproxy.test:1080";
  EnableHost(HostTrigger::ON_COMPLETED);

  routes_ = [](test::FakeTransport& transport) {
    using test::FakeTransport;
    transport.On(HttpMethod::GET, "https://imx.test/", FakeTransport::Respond(200, "ok"));
    transport.On(HttpMethod::POST, "https://imx.test/", FakeTransport::Respond(200, "ok"));
    transport.On(HttpMethod::POST, "https://up.test/upload",
                 FakeTransport::Respond(200, R"({"url":"https://up.test/f/1"})"));
  };
  Launch(false);

  auto id = coordinator_->AddGallery(MakeFolder("proxied", 2), "Proxied Trip");
  ASSERT_TRUE(id.has_value());
  ASSERT_TRUE(coordinator_->WaitUntilIdle(std::chrono::seconds{30}));
  coordinator_->Stop();

  std::lock_guard<std::mutex> lock(transports_mutex_);
  size_t uploads = 0;
  for (auto* transport : transports_) {
    for (const auto& request : transport->Requests()) {
      ASSERT_TRUE(request.proxy_.has_value()) << request.url_;
      if (request.url_.starts_with("https://up.test")) {
        ++uploads;
        EXPECT_EQ(*request.proxy_, "socks5://hostproxy.test:1080");
      } else {
        EXPECT_EQ(*request.proxy_, "");
      }
    }
  }
  EXPECT_EQ(uploads, 1u);
}
}  // namespace imxup
