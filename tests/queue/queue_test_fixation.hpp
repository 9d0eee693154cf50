#pragma once

#include <gtest/gtest.h>

#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <memory>
#include <string>

#include "queue/gallery_scanner.hpp"
#include "queue/queue_manager.hpp"
#include "storage/controller/db_controller.hpp"
#include "support/test_files.hpp"
#include "utils/clock/time_provider.hpp"

namespace imxup {
class QueueManagerTests : public ::testing::Test {
 protected:
  std::filesystem::path         root_;
  std::shared_ptr<DBController> db_;
  std::unique_ptr<QueueManager> queue_;

  void                          SetUp() override {
    TimeProvider::Refresh();
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    root_  = test::MakeScratchDir(::testing::UnitTest::GetInstance()->current_test_info()->name());
    db_    = std::make_shared<DBController>(root_ / "queue.db");
    queue_ = std::make_unique<QueueManager>(db_);
  }

  void TearDown() override {
    queue_.reset();
    db_.reset();
    std::filesystem::remove_all(root_);
  }

  /**
   * @brief Folder with `count` fake JPEGs named img1.jpg .. imgN.jpg
   */
  auto MakeGalleryFolder(const std::string& name, int count, size_t size = 1000)
      -> std::filesystem::path {
    auto folder = root_ / name;
    std::filesystem::create_directories(folder);
    for (int i = 1; i <= count; ++i) {
      test::WriteFakeJpeg(folder / ("img" + std::to_string(i) + ".jpg"), size);
    }
    return folder;
  }

  /**
   * @brief Enqueue and scan a folder, leaving the gallery in Ready
   */
  auto AddReadyGallery(const std::string& name, int count, size_t size = 1000) -> gallery_id_t {
    auto folder = MakeGalleryFolder(name, count, size);
    auto id     = queue_->Enqueue(NewGallery{.path_ = folder, .name_ = name});
    EXPECT_TRUE(id.has_value());
    GalleryScanner scanner{*queue_};
    EXPECT_TRUE(scanner.ScanNow(*id));
    return *id;
  }

  auto AddUploadingGallery(const std::string& name, int count) -> gallery_id_t {
    auto id = AddReadyGallery(name, count);
    EXPECT_EQ(queue_->Transition(id, {GalleryState::READY}, GalleryState::QUEUED),
              TransitionStatus::OK);
    EXPECT_EQ(queue_->Transition(id, {GalleryState::QUEUED}, GalleryState::UPLOADING),
              TransitionStatus::OK);
    return id;
  }

  auto StateOf(gallery_id_t id) -> GalleryState { return queue_->Get(id)->state_; }
};
}  // namespace imxup
