#include <gtest/gtest.h>

#include <filesystem>

#include "queue/gallery_scanner.hpp"
#include "queue/image_files.hpp"
#include "queue_test_fixation.hpp"
#include "support/test_files.hpp"

namespace imxup {
using GalleryScannerTests = QueueManagerTests;

TEST_F(GalleryScannerTests, ScanRecordsFilesAndDimensions) {
  auto folder = root_ / "gifs";
  std::filesystem::create_directories(folder);
  test::WriteGif(folder / "a1.gif", 640, 480);
  test::WriteGif(folder / "a2.gif", 800, 600);

  auto id = queue_->Enqueue(NewGallery{.path_ = folder});
  ASSERT_TRUE(id.has_value());
  GalleryScanner scanner{*queue_};
  ASSERT_TRUE(scanner.ScanNow(*id));

  auto gallery = queue_->Get(*id);
  EXPECT_EQ(gallery->state_, GalleryState::READY);
  EXPECT_EQ(gallery->total_images_, 2);
  EXPECT_DOUBLE_EQ(gallery->dims_.min_width_, 640.0);
  EXPECT_DOUBLE_EQ(gallery->dims_.max_width_, 800.0);
  EXPECT_DOUBLE_EQ(gallery->dims_.avg_height_, 540.0);
}

TEST_F(GalleryScannerTests, EmptyFolderStaysInValidating) {
  auto folder = root_ / "empty";
  std::filesystem::create_directories(folder);
  test::WriteText(folder / "readme.txt", "no images here");

  auto           id = queue_->Enqueue(NewGallery{.path_ = folder});
  GalleryScanner scanner{*queue_};
  EXPECT_FALSE(scanner.ScanNow(*id));

  auto gallery = queue_->Get(*id);
  EXPECT_EQ(gallery->state_, GalleryState::VALIDATING);
  EXPECT_EQ(gallery->error_kind_, ErrorKind::VALIDATION);
  EXPECT_FALSE(gallery->error_message_.empty());

  // Not retried once rejected, even if images show up later
  test::WriteFakeJpeg(folder / "late.jpg");
  EXPECT_FALSE(scanner.ScanNow(*id));
  EXPECT_EQ(queue_->Get(*id)->state_, GalleryState::VALIDATING);
}

TEST_F(GalleryScannerTests, MissingFolderIsValidationFailure) {
  auto           id = queue_->Enqueue(NewGallery{.path_ = root_ / "does_not_exist"});
  GalleryScanner scanner{*queue_};
  EXPECT_FALSE(scanner.ScanNow(*id));
  EXPECT_EQ(queue_->Get(*id)->error_kind_, ErrorKind::VALIDATION);
}

TEST_F(GalleryScannerTests, WrongSignatureIsRejected) {
  auto folder = MakeGalleryFolder("mixed", 2);
  test::WriteText(folder / "fake.png", "this is not a png");

  auto           id = queue_->Enqueue(NewGallery{.path_ = folder});
  GalleryScanner scanner{*queue_};
  EXPECT_FALSE(scanner.ScanNow(*id));
  auto gallery = queue_->Get(*id);
  EXPECT_EQ(gallery->state_, GalleryState::VALIDATING);
  EXPECT_NE(gallery->error_message_.find("fake.png"), std::string::npos);
}

TEST_F(GalleryScannerTests, AutoStartGoesStraightToQueued) {
  auto folder = MakeGalleryFolder("auto", 1);
  auto id     = queue_->Enqueue(NewGallery{.path_ = folder, .auto_start_ = true});
  GalleryScanner scanner{*queue_};
  ASSERT_TRUE(scanner.ScanNow(*id));
  EXPECT_EQ(queue_->Get(*id)->state_, GalleryState::QUEUED);
}

TEST_F(GalleryScannerTests, BackgroundThreadDrainsRequests) {
  auto           id = queue_->Enqueue(NewGallery{.path_ = MakeGalleryFolder("bg", 2)});
  auto           subscription = queue_->Events().Subscribe();
  GalleryScanner scanner{*queue_};
  scanner.Start();
  scanner.Submit(*id);

  bool ready = false;
  for (int i = 0; i < 50 && !ready; ++i) {
    for (const auto& event : subscription->WaitAndDrain(std::chrono::milliseconds(100))) {
      if (event.id_ == *id && event.to_ == GalleryState::READY) ready = true;
    }
  }
  scanner.Stop();
  EXPECT_TRUE(ready);
}

TEST(ImageFilesTest, SignatureChecks) {
  auto dir = test::MakeScratchDir("signatures");
  test::WriteFakeJpeg(dir / "a.jpg");
  test::WriteGif(dir / "b.gif", 1, 1);
  test::WriteText(dir / "c.jpg", "xx");
  EXPECT_TRUE(HasImageSignature(dir / "a.jpg"));
  EXPECT_TRUE(HasImageSignature(dir / "b.gif"));
  EXPECT_FALSE(HasImageSignature(dir / "c.jpg"));
  EXPECT_FALSE(HasImageSignature(dir / "missing.jpg"));
  EXPECT_TRUE(IsImageExtension("photo.JPEG"));
  EXPECT_FALSE(IsImageExtension("photo.webp"));
  std::filesystem::remove_all(dir);
}
}  // namespace imxup
