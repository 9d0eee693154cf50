#include "upload/upload_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <json.hpp>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "queue/queue_test_fixation.hpp"
#include "storage/storage_error.hpp"
#include "support/fake_primary_host_client.hpp"
#include "support/test_files.hpp"

namespace imxup {
using json = nlohmann::json;

namespace {
struct RecordingListener : UploadListener {
  std::vector<std::string> calls_;
  std::function<void(const Gallery&)> on_started_;
  std::function<void(const Gallery&)> on_created_;

  void OnGalleryStarted(const Gallery& gallery) override {
    calls_.push_back("started");
    if (on_started_) on_started_(gallery);
  }
  void OnGalleryCreated(const Gallery& gallery, const std::string& host_gallery_id) override {
    calls_.push_back("created " + host_gallery_id);
    if (on_created_) on_created_(gallery);
  }
  void OnGalleryFinished(const Gallery& gallery, GalleryState state,
                         const std::optional<file_path_t>& artifact) override {
    calls_.push_back("finished " + std::string(ToString(state)));
  }
};
}  // namespace

class UploadEngineTests : public QueueManagerTests {
 protected:
  test::FakePrimaryHostClient   client_;
  std::unique_ptr<WorkerStatusTable> status_;
  std::unique_ptr<UploadEngine> engine_;
  RecordingListener             listener_;

  void                          SetUp() override {
    QueueManagerTests::SetUp();
    status_ = std::make_unique<WorkerStatusTable>();
    PrimaryHostSettings settings;
    settings.parallel_batch_size_ = 2;
    settings.retry_passes_        = 2;
    engine_ = std::make_unique<UploadEngine>(settings, client_, *queue_, *status_,
                                             root_ / "artifacts");
    engine_->SetListener(&listener_);
  }

  void TearDown() override {
    engine_.reset();
    status_.reset();
    QueueManagerTests::TearDown();
  }

  auto AddQueuedGallery(const std::string& name, int count) -> gallery_id_t {
    auto id = AddReadyGallery(name, count);
    EXPECT_EQ(queue_->Transition(id, {GalleryState::READY}, GalleryState::QUEUED),
              TransitionStatus::OK);
    return id;
  }

  auto UploadedNames(gallery_id_t id) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& file : queue_->GetFiles(id)) {
      if (file.uploaded_) names.push_back(file.file_name_);
    }
    return names;
  }
};

TEST(TransferCounterTests, ConcurrentIncrementsAreNotLost) {
  TransferCounter          counter;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&counter] {
      for (int i = 0; i < 10000; ++i) counter.Add(3);
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_EQ(counter.Value(), 240000);

  EXPECT_EQ(counter.Add(-50), 240000);
  EXPECT_EQ(counter.Value(), 240000);
}

TEST_F(UploadEngineTests, ClaimsOldestQueuedGalleryFirst) {
  auto first  = AddQueuedGallery("first", 1);
  auto second = AddQueuedGallery("second", 1);

  auto claimed = engine_->ClaimNext();
  ASSERT_TRUE(claimed.has_value());
  EXPECT_EQ(claimed->id_, first);
  EXPECT_EQ(StateOf(first), GalleryState::UPLOADING);
  EXPECT_GT(queue_->Get(first)->started_ts_, 0);

  EXPECT_EQ(engine_->ClaimNext()->id_, second);
  EXPECT_FALSE(engine_->ClaimNext().has_value());
}

TEST_F(UploadEngineTests, ConcurrentClaimantsNeverShareAGallery) {
  std::vector<gallery_id_t> ids;
  for (int i = 0; i < 4; ++i) ids.push_back(AddQueuedGallery("g" + std::to_string(i), 1));

  std::mutex                mutex;
  std::vector<gallery_id_t> claimed;
  std::vector<std::thread>  threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      while (auto gallery = engine_->ClaimNext()) {
        std::lock_guard<std::mutex> lock(mutex);
        claimed.push_back(gallery->id_);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  std::set<gallery_id_t> unique(claimed.begin(), claimed.end());
  EXPECT_EQ(claimed.size(), 4u);
  EXPECT_EQ(unique, std::set<gallery_id_t>(ids.begin(), ids.end()));
}

TEST_F(UploadEngineTests, NewGalleryUploadsEveryImage) {
  auto events = queue_->Events().Subscribe();
  auto id     = AddQueuedGallery("Summer Trip", 3);

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::COMPLETED);
  EXPECT_EQ(report->files_uploaded_, 3);
  EXPECT_EQ(report->bytes_sent_, 3000);
  EXPECT_EQ(report->host_gallery_id_, "G1");

  auto gallery = queue_->Get(id);
  EXPECT_EQ(gallery->state_, GalleryState::COMPLETED);
  EXPECT_EQ(gallery->uploaded_images_, 3);
  EXPECT_EQ(gallery->uploaded_bytes_, 3000);
  EXPECT_EQ(gallery->host_gallery_id_, "G1");
  EXPECT_EQ(gallery->gallery_url_, "https://imx.test/g/G1");
  EXPECT_GT(gallery->finished_ts_, 0);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::NONE);

  std::vector<GalleryState> seen;
  for (const auto& event : events->Drain()) {
    if (event.id_ == id) seen.push_back(event.to_);
  }
  std::vector<GalleryState> expected = {GalleryState::SCANNING, GalleryState::READY,
                                        GalleryState::QUEUED, GalleryState::UPLOADING,
                                        GalleryState::COMPLETED};
  EXPECT_EQ(seen, expected);

  // The first image opens the gallery, the others join it
  auto requests = client_.Requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_TRUE(requests[0].create_gallery_);
  EXPECT_EQ(requests[0].file_.filename().string(), "img1.jpg");
  for (size_t i = 1; i < requests.size(); ++i) {
    EXPECT_FALSE(requests[i].create_gallery_);
    EXPECT_EQ(requests[i].gallery_id_, "G1");
  }

  for (const auto& file : queue_->GetFiles(id)) {
    EXPECT_TRUE(file.uploaded_);
    EXPECT_EQ(file.image_url_, "https://imx.test/i/" + file.file_name_);
  }

  std::vector<std::string> calls = {"started", "created G1", "finished completed"};
  EXPECT_EQ(listener_.calls_, calls);

  auto status = status_->Get(kPrimaryWorkerId);
  ASSERT_TRUE(status.has_value());
  const auto& primary = std::get<ActiveWorker>(*status);
  EXPECT_EQ(primary.kind_, WorkerKind::PRIMARY);
  EXPECT_EQ(primary.bytes_done_, 3000);
  EXPECT_EQ(primary.files_done_, 3);
  EXPECT_EQ(primary.state_, "idle");
}

TEST_F(UploadEngineTests, EachRunFeedsPrimaryHostMetrics) {
  auto id = AddQueuedGallery("Metrics", 3);
  listener_.on_created_ = [this](const Gallery& gallery) { engine_->RequestStop(gallery.id_); };
  ASSERT_EQ(engine_->RunNext()->state_, GalleryState::PAUSED);

  listener_.on_created_ = nullptr;
  ASSERT_EQ(queue_->Resume(id), TransitionStatus::OK);
  ASSERT_EQ(engine_->UploadGallery(id)->state_, GalleryState::COMPLETED);

  // Images left behind by the stop are not failures, the resumed run counts only its own
  auto metrics = queue_->GetHostMetrics(kPrimaryMetricsHost, MetricsPeriod::ALL_TIME);
  EXPECT_EQ(metrics.files_uploaded_, 3);
  EXPECT_EQ(metrics.files_failed_, 0);
  EXPECT_EQ(metrics.bytes_uploaded_, 3000);
}

TEST_F(UploadEngineTests, CompletedGalleryWritesArtifact) {
  AddQueuedGallery("Summer Trip", 3);
  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  ASSERT_TRUE(report->artifact_.has_value());
  EXPECT_EQ(report->artifact_->filename(), "Summer Trip_G1.json");

  std::ifstream in(*report->artifact_);
  auto          doc = json::parse(in);
  EXPECT_EQ(doc["meta"]["gallery_id"], "G1");
  EXPECT_EQ(doc["meta"]["gallery_name"], "Summer Trip");
  EXPECT_EQ(doc["meta"]["uploaded_images"], 3);
  ASSERT_EQ(doc["images"].size(), 3u);
  EXPECT_EQ(doc["images"][0]["filename"], "img1.jpg");
  EXPECT_EQ(doc["images"][2]["filename"], "img3.jpg");
  EXPECT_EQ(doc["images"][1]["thumb_url"], "https://imx.test/u/t/img2.jpg");
}

TEST_F(UploadEngineTests, UserStopPausesAndResumeSendsOnlyMissingImages) {
  auto id           = AddQueuedGallery("stop", 3);
  listener_.on_created_ = [this](const Gallery& gallery) { engine_->RequestStop(gallery.id_); };

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::PAUSED);
  EXPECT_EQ(report->files_uploaded_, 1);
  auto paused = queue_->Get(id);
  EXPECT_EQ(paused->state_, GalleryState::PAUSED);
  EXPECT_EQ(paused->paused_from_.value_or(GalleryState::VALIDATING), GalleryState::UPLOADING);
  EXPECT_EQ(paused->uploaded_images_, 1);
  EXPECT_EQ(paused->error_kind_, ErrorKind::NONE);
  EXPECT_EQ(client_.Attempts().size(), 1u);
  EXPECT_FALSE(engine_->RequestStop(id));

  listener_.on_created_ = nullptr;
  ASSERT_EQ(queue_->Resume(id), TransitionStatus::OK);
  ASSERT_EQ(StateOf(id), GalleryState::UPLOADING);
  auto resumed = engine_->UploadGallery(id);
  ASSERT_TRUE(resumed.has_value());
  EXPECT_EQ(resumed->state_, GalleryState::COMPLETED);
  EXPECT_EQ(resumed->files_uploaded_, 3);

  auto uploaded = client_.Uploaded();
  std::sort(uploaded.begin(), uploaded.end());
  std::vector<std::string> expected = {"img1.jpg", "img2.jpg", "img3.jpg"};
  EXPECT_EQ(uploaded, expected);
  for (const auto& request : client_.Requests()) {
    if (request.file_.filename().string() != "img1.jpg") EXPECT_EQ(request.gallery_id_, "G1");
  }
  EXPECT_EQ(queue_->Get(id)->uploaded_bytes_, 3000);
}

TEST_F(UploadEngineTests, PartialFailureEndsIncomplete) {
  auto id = AddQueuedGallery("partial", 3);
  client_.FailNext("img2.jpg", FailureKind::REJECTED, 3);

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::INCOMPLETE);
  EXPECT_EQ(report->files_failed_, 1);
  EXPECT_FALSE(report->artifact_.has_value());

  auto gallery = queue_->Get(id);
  EXPECT_EQ(gallery->state_, GalleryState::INCOMPLETE);
  EXPECT_EQ(gallery->uploaded_images_, 2);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::REJECTED);
  EXPECT_FALSE(gallery->error_message_.empty());

  // One first attempt plus two retry passes
  auto attempts = client_.Attempts();
  EXPECT_EQ(std::count(attempts.begin(), attempts.end(), "img2.jpg"), 3);

  auto requeued = queue_->Requeue(id);
  ASSERT_EQ(requeued.status_, TransitionStatus::OK);
  EXPECT_EQ(requeued.file_count_, 1u);
  auto next = engine_->RunNext();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->gallery_id_, requeued.new_id_);
  EXPECT_EQ(next->state_, GalleryState::COMPLETED);
  EXPECT_EQ(client_.Requests().back().gallery_id_, "G1");
}

TEST_F(UploadEngineTests, NothingUploadedEndsFailed) {
  auto id = AddQueuedGallery("broken", 3);
  for (const auto* name : {"img1.jpg", "img2.jpg", "img3.jpg"}) {
    client_.FailNext(name, FailureKind::NETWORK, 10);
  }

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::FAILED);
  auto gallery = queue_->Get(id);
  EXPECT_EQ(gallery->state_, GalleryState::FAILED);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::NETWORK);
  EXPECT_TRUE(gallery->host_gallery_id_.empty());
  EXPECT_EQ(client_.Attempts().size(), 9u);
  EXPECT_EQ(listener_.calls_.back(), "finished failed");
}

TEST_F(UploadEngineTests, RetryPassRecoversTransientFailure) {
  auto id = AddQueuedGallery("flaky", 3);
  client_.FailNext("img3.jpg", FailureKind::NETWORK);

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::COMPLETED);
  EXPECT_EQ(queue_->Get(id)->error_kind_, ErrorKind::NONE);
  auto attempts = client_.Attempts();
  EXPECT_EQ(std::count(attempts.begin(), attempts.end(), "img3.jpg"), 2);
}

TEST_F(UploadEngineTests, FailedFirstImageLetsNextOneCreateGallery) {
  auto id = AddQueuedGallery("late", 3);
  client_.FailNext("img1.jpg", FailureKind::NETWORK);

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::COMPLETED);
  auto requests = client_.Requests();
  ASSERT_GE(requests.size(), 2u);
  EXPECT_TRUE(requests[0].create_gallery_);
  EXPECT_TRUE(requests[1].create_gallery_);
  EXPECT_EQ(requests[1].file_.filename().string(), "img2.jpg");
  EXPECT_EQ(requests.back().file_.filename().string(), "img1.jpg");
  EXPECT_EQ(requests.back().gallery_id_, "G1");
  EXPECT_EQ(UploadedNames(id).size(), 3u);
}

TEST_F(UploadEngineTests, RejectedCredentialsStopTheGallery) {
  auto id = AddQueuedGallery("auth", 3);
  client_.FailNext("img1.jpg", FailureKind::AUTH);

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::FAILED);
  EXPECT_EQ(report->error_kind_, ErrorKind::AUTH);
  EXPECT_EQ(client_.Attempts().size(), 1u);
  EXPECT_EQ(queue_->Get(id)->error_kind_, ErrorKind::AUTH);

  auto status = std::get<ActiveWorker>(*status_->Get(kPrimaryWorkerId));
  EXPECT_FALSE(status.last_error_.empty());
}

TEST_F(UploadEngineTests, QuotaAfterPartialProgressEndsIncomplete) {
  auto id = AddQueuedGallery("quota", 4);
  client_.OnUpload([this](const std::string& name) {
    if (name == "img1.jpg") {
      client_.FailNext("img2.jpg", FailureKind::QUOTA);
      client_.FailNext("img3.jpg", FailureKind::QUOTA);
      client_.FailNext("img4.jpg", FailureKind::QUOTA);
    }
  });

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::INCOMPLETE);
  EXPECT_EQ(report->error_kind_, ErrorKind::QUOTA);
  EXPECT_EQ(StateOf(id), GalleryState::INCOMPLETE);
  EXPECT_EQ(UploadedNames(id), std::vector<std::string>{"img1.jpg"});
}

TEST_F(UploadEngineTests, AbortBeforeFirstImageFailsGallery) {
  auto id = AddQueuedGallery("aborted", 2);
  listener_.on_started_ = [this](const Gallery& gallery) {
    EXPECT_TRUE(engine_->Abort(gallery.id_, ErrorKind::HOOK, "start hook failed"));
  };

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::FAILED);
  EXPECT_EQ(report->error_kind_, ErrorKind::HOOK);
  EXPECT_TRUE(client_.Attempts().empty());
  auto gallery = queue_->Get(id);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::HOOK);
  EXPECT_EQ(gallery->error_message_, "start hook failed");
  EXPECT_FALSE(engine_->Abort(id, ErrorKind::HOOK, "late"));
}

TEST_F(UploadEngineTests, UnavailableStoreEndsGalleryAndFreesIt) {
  auto id = AddQueuedGallery("outage", 3);
  listener_.on_created_ = [](const Gallery&) {
    throw StorageUnavailableError("update_fields: database is locked");
  };

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::INCOMPLETE);
  EXPECT_EQ(report->error_kind_, ErrorKind::STORAGE);
  EXPECT_EQ(report->files_uploaded_, 1);
  EXPECT_TRUE(engine_->ActiveGalleries().empty());

  auto gallery = queue_->Get(id);
  EXPECT_EQ(gallery->state_, GalleryState::INCOMPLETE);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::STORAGE);
  EXPECT_EQ(client_.Attempts().size(), 1u);

  auto primary = std::get<ActiveWorker>(*status_->Get(kPrimaryWorkerId));
  EXPECT_EQ(primary.state_, "idle");
  EXPECT_EQ(primary.last_error_, "update_fields: database is locked");
  EXPECT_EQ(listener_.calls_.back(), "finished incomplete");
}

TEST_F(UploadEngineTests, StoreFailureBeforeAnyImageFailsGallery) {
  auto id = AddQueuedGallery("early", 2);
  listener_.on_started_ = [](const Gallery&) {
    throw StorageUnavailableError("update_fields: database is locked");
  };

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->state_, GalleryState::FAILED);
  EXPECT_TRUE(client_.Attempts().empty());
  EXPECT_EQ(StateOf(id), GalleryState::FAILED);
  EXPECT_TRUE(engine_->ActiveGalleries().empty());
  EXPECT_EQ(std::get<ActiveWorker>(*status_->Get(kPrimaryWorkerId)).state_, "idle");

  listener_.on_started_ = nullptr;
  auto other = AddQueuedGallery("after", 1);
  auto next  = engine_->RunNext();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->gallery_id_, other);
  EXPECT_EQ(next->state_, GalleryState::COMPLETED);
}

TEST_F(UploadEngineTests, AppendUploadsIntoExistingGallery) {
  auto id = AddQueuedGallery("album", 2);
  ASSERT_EQ(engine_->RunNext()->state_, GalleryState::COMPLETED);

  test::WriteFakeJpeg(root_ / "album" / "img3.jpg", 1000);
  auto appended = queue_->AppendFiles(id, {"img3.jpg"});
  ASSERT_EQ(appended.status_, TransitionStatus::OK);

  auto report = engine_->RunNext();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->gallery_id_, appended.new_id_);
  EXPECT_EQ(report->state_, GalleryState::COMPLETED);
  EXPECT_EQ(report->files_total_, 1);

  auto last = client_.Requests().back();
  EXPECT_EQ(last.file_.filename().string(), "img3.jpg");
  EXPECT_FALSE(last.create_gallery_);
  EXPECT_EQ(last.gallery_id_, "G1");
  EXPECT_EQ(client_.Requests().size(), 3u);
}

TEST_F(UploadEngineTests, OnlyOwnedGalleriesAreUploaded) {
  auto ready = AddReadyGallery("ready", 1);
  EXPECT_FALSE(engine_->UploadGallery(ready).has_value());
  EXPECT_FALSE(engine_->UploadGallery(9999).has_value());
  EXPECT_TRUE(client_.Attempts().empty());
  EXPECT_EQ(StateOf(ready), GalleryState::READY);
}

TEST(GalleryArtifactTests, ListsUploadedImagesOnly) {
  Gallery gallery;
  gallery.id_              = 7;
  gallery.name_            = "Trip: Day/1";
  gallery.host_gallery_id_ = "abc";
  gallery.total_images_    = 2;
  gallery.ext_[0]          = "mirror-link";

  GalleryFile sent;
  sent.file_name_ = "Photo.JPG";
  sent.uploaded_  = true;
  sent.image_url_ = "https://imx.test/i/1";
  GalleryFile missing;
  missing.file_name_ = "second.jpg";

  auto doc = BuildGalleryArtifact(gallery, {sent, missing}, 3, 2);
  ASSERT_EQ(doc["images"].size(), 1u);
  EXPECT_EQ(doc["images"][0]["filename"], "Photo.jpg");
  EXPECT_EQ(doc["meta"]["uploaded_images"], 1);
  EXPECT_EQ(doc["meta"]["ext1"], "mirror-link");
  EXPECT_FALSE(doc["meta"].contains("ext2"));
  EXPECT_EQ(doc["meta"]["thumbnail_size"], 3);

  auto name = ArtifactFileName(gallery);
  EXPECT_TRUE(name.ends_with("_abc.json"));
  EXPECT_EQ(name.find('/'), std::string::npos);
}
}  // namespace imxup
