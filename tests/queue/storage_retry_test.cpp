#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "storage/storage_error.hpp"
#include "storage/storage_retry.hpp"
#include "utils/retry/backoff.hpp"

namespace imxup {
namespace {
struct RecordingSleep {
  std::vector<std::chrono::milliseconds> delays_;
  auto                                   Fn() -> SleepFn {
    return [this](std::chrono::milliseconds d) { delays_.push_back(d); };
  }
};
}  // namespace

TEST(StorageRetryTest, ContentionMessagesAreRecognised) {
  EXPECT_TRUE(StorageError::LooksLikeContention("TransactionContext Error: Conflict on update"));
  EXPECT_TRUE(StorageError::LooksLikeContention("IO Error: Could not set lock on file"));
  EXPECT_TRUE(StorageError::LooksLikeContention("database is locked"));
  EXPECT_FALSE(StorageError::LooksLikeContention("Binder Error: column foo not found"));
  EXPECT_TRUE(StorageError("write-write conflict").IsContention());
}

TEST(StorageRetryTest, RetriesContentionThenSucceeds) {
  RecordingSleep sleep;
  int            calls = 0;
  auto result = RetryOnContention(BackoffPolicy{}, sleep.Fn(), "test", [&] {
    if (++calls < 3) throw StorageError("Conflict on tuple", true);
    return 42;
  });
  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(sleep.delays_.size(), 2u);
  EXPECT_EQ(sleep.delays_[0], std::chrono::milliseconds(1000));
  EXPECT_EQ(sleep.delays_[1], std::chrono::milliseconds(2000));
}

TEST(StorageRetryTest, ExhaustionSurfacesStorageUnavailable) {
  RecordingSleep sleep;
  int            calls = 0;
  BackoffPolicy  policy;
  policy.max_attempts_ = 4;
  EXPECT_THROW(RetryOnContention(policy, sleep.Fn(), "test",
                                 [&]() -> int {
                                   ++calls;
                                   throw StorageError("database is locked");
                                 }),
               StorageUnavailableError);
  EXPECT_EQ(calls, 4);
  EXPECT_EQ(sleep.delays_.size(), 3u);
}

TEST(StorageRetryTest, OtherErrorsAreNotRetried) {
  RecordingSleep sleep;
  int            calls = 0;
  EXPECT_THROW(RetryOnContention(BackoffPolicy{}, sleep.Fn(), "test",
                                 [&]() -> int {
                                   ++calls;
                                   throw StorageError("Constraint Error: duplicate key", false);
                                 }),
               StorageError);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleep.delays_.empty());
}

TEST(StorageRetryTest, BackoffIsCappedAndConfigurable) {
  auto policy = nlohmann::json::parse(R"({"max_attempts": 5, "base_delay_ms": 100,
                                          "factor": 3.0, "max_delay_ms": 500})")
                    .get<BackoffPolicy>();
  EXPECT_EQ(policy.max_attempts_, 5u);
  EXPECT_EQ(policy.DelayAfter(1), std::chrono::milliseconds(100));
  EXPECT_EQ(policy.DelayAfter(2), std::chrono::milliseconds(300));
  EXPECT_EQ(policy.DelayAfter(3), std::chrono::milliseconds(500));
}
}  // namespace imxup
