#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "queue/queue_test_fixation.hpp"
#include "support/fake_transport.hpp"
#include "support/test_files.hpp"
#include "workers/rename_worker.hpp"
#include "workers/worker_status_table.hpp"

namespace imxup {
namespace {
constexpr const char* kWeb     = "https://imx.test";
constexpr const char* kEdit    = "https://imx.test/user/gallery/edit?id=";
constexpr const char* kLogin   = "https://imx.test/login.php";
constexpr const char* kManage  = "https://imx.test/user/gallery/manage";

auto Landing(long status, std::string final_url, std::string body = {})
    -> test::FakeTransport::Handler {
  return [=](const HttpRequest&, const TransferControl&) {
    HttpResponse response;
    response.status_    = status;
    response.body_      = body;
    response.final_url_ = final_url;
    return response;
  };
}
}  // namespace

class RenameWorkerTests : public QueueManagerTests {
 protected:
  std::chrono::steady_clock::time_point now_ = std::chrono::steady_clock::now();
  test::FakeTransport                   transport_;
  std::unique_ptr<WorkerStatusTable>    status_;
  std::unique_ptr<RenameWorker>         worker_;

  void SetUp() override {
    QueueManagerTests::SetUp();
    status_ = std::make_unique<WorkerStatusTable>();
    worker_ = MakeWorker("user@example.com", "secret");
  }

  void TearDown() override {
    worker_.reset();
    status_.reset();
    QueueManagerTests::TearDown();
  }

  auto MakeWorker(std::string user, std::string password, file_path_t cookies = {})
      -> std::unique_ptr<RenameWorker> {
    RenameSettings settings;
    settings.web_url_     = kWeb;
    settings.username_    = std::move(user);
    settings.password_    = std::move(password);
    settings.cookie_file_ = std::move(cookies);
    return std::make_unique<RenameWorker>(settings, transport_, *queue_, *status_,
                                          [this] { return now_; });
  }

  void LoginSucceeds() {
    transport_.On(HttpMethod::POST, kLogin, Landing(200, "https://imx.test/user/dashboard"));
  }

  void LoginRefused() {
    transport_.On(HttpMethod::POST, kLogin, Landing(200, kLogin, "Wrong password"));
  }

  void LoggedOutEditPage(const std::string& id) {
    transport_.On(HttpMethod::GET, kEdit + id, Landing(200, kLogin, "<form>"));
  }

  void EditPageWorks(const std::string& id) {
    transport_.On(HttpMethod::GET, kEdit + id, test::FakeTransport::Respond(200, "<form>"));
    transport_.On(HttpMethod::POST, kEdit + id, test::FakeTransport::Respond(200, "Saved"));
  }

  auto UnnamedIds() -> std::vector<std::string> {
    std::vector<std::string> ids;
    for (const auto& unnamed : queue_->GetUnnamed()) ids.push_back(unnamed.host_gallery_id_);
    return ids;
  }
};

TEST_F(RenameWorkerTests, SanitizesNameBeforeSubmitting) {
  EditPageWorks("abc");
  queue_->AddUnnamed("abc", "Trip");

  EXPECT_EQ(worker_->RenameNow("abc", "  Summer*Trip!!   2024 "), RenameStatus::OK);

  auto requests = transport_.Requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[1].method_, HttpMethod::POST);
  EXPECT_EQ(requests[1].body_, "gallery_name=SummerTrip%202024&submit_new_gallery=Rename%20Gallery");
  EXPECT_TRUE(UnnamedIds().empty());
  EXPECT_EQ(worker_->LoginAttempts(), 0u);
}

TEST_F(RenameWorkerTests, LoggedOutSessionLogsInAndRetriesOnce) {
  transport_.On(HttpMethod::GET, kEdit + std::string("g1"), Landing(200, kLogin, "<form>"));
  transport_.On(HttpMethod::GET, kEdit + std::string("g1"),
                test::FakeTransport::Respond(200, "<form>"));
  transport_.On(HttpMethod::POST, kEdit + std::string("g1"),
                test::FakeTransport::Respond(200, "Saved"));
  LoginSucceeds();

  EXPECT_EQ(worker_->RenameNow("g1", "Holiday"), RenameStatus::OK);
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 1u);
  EXPECT_EQ(transport_.Count(HttpMethod::GET, kEdit), 2u);
  auto login = transport_.Requests();
  auto post  = std::find_if(login.begin(), login.end(),
                            [](const HttpRequest& r) { return r.url_ == kLogin; });
  ASSERT_NE(post, login.end());
  EXPECT_EQ(post->body_, "usr_email=user%40example.com&pwd=secret&remember=1&doLogin=Login");
}

TEST_F(RenameWorkerTests, ReauthenticatesAtMostOncePerWindow) {
  for (const auto* id : {"a", "b", "c", "d", "e", "f"}) LoggedOutEditPage(id);
  LoginRefused();

  for (const auto* id : {"a", "b", "c", "d", "e"}) {
    EXPECT_EQ(worker_->RenameNow(id, "Name"), RenameStatus::NOT_LOGGED_IN);
    now_ += std::chrono::milliseconds{900};
  }
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 1u);
  EXPECT_EQ(UnnamedIds().size(), 5u);

  now_ += std::chrono::seconds{2};
  EXPECT_EQ(worker_->RenameNow("f", "Name"), RenameStatus::NOT_LOGGED_IN);
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 2u);
}

TEST_F(RenameWorkerTests, ConcurrentExpiredRequestsShareOneLogin) {
  for (int i = 0; i < 8; ++i) LoggedOutEditPage("p" + std::to_string(i));
  LoginRefused();

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, i] { worker_->RenameNow("p" + std::to_string(i), "Name"); });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 1u);
}

TEST_F(RenameWorkerTests, AntiBotChallengeIsReportedDistinctly) {
  transport_.On(HttpMethod::GET, kEdit + std::string("x"),
                test::FakeTransport::Respond(200, "<title>DDoS-Guard</title>"));

  EXPECT_EQ(worker_->RenameNow("x", "Blocked"), RenameStatus::ANTI_BOT);
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 0u);
  auto unnamed = queue_->GetUnnamed();
  ASSERT_EQ(unnamed.size(), 1u);
  EXPECT_EQ(unnamed[0].intended_name_, "Blocked");

  auto entry = std::get<ActiveWorker>(*status_->Get(kRenameWorkerId));
  EXPECT_EQ(entry.kind_, WorkerKind::RENAME);
  EXPECT_EQ(entry.last_error_, "rename anti_bot");
}

TEST_F(RenameWorkerTests, ServerErrorLeavesGalleryUnnamed) {
  transport_.On(HttpMethod::GET, kEdit + std::string("s"),
                test::FakeTransport::Respond(500, "oops"));
  EXPECT_EQ(worker_->RenameNow("s", "Later"), RenameStatus::FAILED);
  EXPECT_EQ(UnnamedIds(), std::vector<std::string>{"s"});
}

TEST_F(RenameWorkerTests, SuccessfulLoginRenamesRecordedGalleries) {
  queue_->AddUnnamed("u1", "First");
  queue_->AddUnnamed("u2", "Second");
  EditPageWorks("u1");
  EditPageWorks("u2");
  LoginSucceeds();

  EXPECT_EQ(worker_->Login(), RenameStatus::OK);
  EXPECT_EQ(worker_->RetryUnnamed(), 2u);
  EXPECT_TRUE(UnnamedIds().empty());
}

TEST_F(RenameWorkerTests, LoginWithoutCredentials) {
  auto anonymous = MakeWorker("", "");
  EXPECT_EQ(anonymous->Login(), RenameStatus::NO_CREDENTIALS);
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 0u);
}

TEST_F(RenameWorkerTests, LoginBlockedByAntiBot) {
  transport_.On(HttpMethod::POST, kLogin, Landing(403, kLogin, "Checking your browser DDoS-Guard"));
  EXPECT_EQ(worker_->Login(), RenameStatus::ANTI_BOT);
}

TEST_F(RenameWorkerTests, ValidCookieSessionSkipsLoginForm) {
  auto cookies = root_ / "cookies.txt";
  test::WriteText(cookies,
                  "# Netscape HTTP Cookie File\n"
                  ".imx.test\tTRUE\t/\tTRUE\t0\tPHPSESSID\tabc123\n"
                  ".other.test\tTRUE\t/\tTRUE\t0\tforeign\tzzz\n"
                  "broken line\n");
  transport_.On(HttpMethod::GET, kManage, test::FakeTransport::Respond(200, "<table>"));
  auto worker = MakeWorker("", "", cookies);

  EXPECT_EQ(worker->Login(), RenameStatus::OK);
  EXPECT_EQ(transport_.Cookies().size(), 1u);
  EXPECT_EQ(transport_.Cookies().at("PHPSESSID"), "abc123");
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 0u);
}

TEST_F(RenameWorkerTests, ExpiredCookieSessionFallsBackToCredentials) {
  transport_.SetCookie("imx.test", "PHPSESSID", "old");
  transport_.On(HttpMethod::GET, kManage, Landing(200, kLogin, "<form>"));
  LoginSucceeds();
  EXPECT_EQ(worker_->Login(), RenameStatus::OK);
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kLogin), 1u);
}

TEST_F(RenameWorkerTests, BackgroundQueueRenamesSubmittedGalleries) {
  LoginSucceeds();
  EditPageWorks("bg1");
  EditPageWorks("bg2");

  worker_->Start();
  EXPECT_TRUE(worker_->Submit("bg1", "One"));
  EXPECT_TRUE(worker_->Submit("bg2", "Two"));
  EXPECT_FALSE(worker_->Submit("", "Nothing"));

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
  while (transport_.Count(HttpMethod::POST, kEdit) < 2 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
  }
  worker_->Stop();
  EXPECT_EQ(transport_.Count(HttpMethod::POST, kEdit), 2u);
  EXPECT_TRUE(UnnamedIds().empty());
}
};  // namespace imxup
