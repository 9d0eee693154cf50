#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <vector>

#include "workers/worker_status_table.hpp"

namespace imxup {
namespace {
auto Active(const std::string& host) -> ActiveWorker {
  ActiveWorker worker;
  worker.id_        = FileHostWorkerId(host);
  worker.host_name_ = host;
  return worker;
}
}  // namespace

TEST(WorkerStatusTableTest, PlaceholdersKeepLookupsTotal) {
  WorkerStatusTable table;
  table.Reset({Active("rapidgator"), PlaceholderWorker{FileHostWorkerId("keep2share"),
                                                       WorkerKind::FILE_HOST, "keep2share"}});

  auto disabled = table.Get(FileHostWorkerId("keep2share"));
  ASSERT_TRUE(disabled.has_value());
  EXPECT_TRUE(IsPlaceholder(*disabled));
  EXPECT_FALSE(table.Get(FileHostWorkerId("nowhere")).has_value());

  // Placeholders carry no live state
  EXPECT_FALSE(table.BeginJob(FileHostWorkerId("keep2share"), 100).has_value());
  table.SetError(FileHostWorkerId("keep2share"), "boom");
  EXPECT_TRUE(IsPlaceholder(*table.Get(FileHostWorkerId("keep2share"))));

  auto snapshot = table.TakeSnapshot();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(IdOf(snapshot[0]), "filehost:keep2share");
}

TEST(WorkerStatusTableTest, ProgressNeverGoesBackwards) {
  WorkerStatusTable table;
  table.Put(Active("pixeldrain"));
  auto id  = FileHostWorkerId("pixeldrain");
  auto job = table.BeginJob(id, 1000, 1);
  ASSERT_TRUE(job.has_value());

  EXPECT_TRUE(table.UpdateProgress(id, *job, 400));
  EXPECT_FALSE(table.UpdateProgress(id, *job, 300));
  EXPECT_TRUE(table.UpdateProgress(id, *job, 400, -1, 2048.0));
  EXPECT_EQ(std::get<ActiveWorker>(*table.Get(id)).bytes_done_, 400);
  EXPECT_DOUBLE_EQ(std::get<ActiveWorker>(*table.Get(id)).speed_bps_, 2048.0);

  // Late updates of an earlier job are dropped
  auto next = table.BeginJob(id, 50);
  EXPECT_FALSE(table.UpdateProgress(id, *job, 900));
  EXPECT_EQ(std::get<ActiveWorker>(*table.Get(id)).bytes_done_, 0);
  EXPECT_TRUE(table.UpdateProgress(id, *next, 10));
}

TEST(WorkerStatusTableTest, ConcurrentOutOfOrderUpdatesStayMonotonic) {
  WorkerStatusTable table;
  table.Put(Active("filedot"));
  auto                     id  = FileHostWorkerId("filedot");
  auto                     job = *table.BeginJob(id, 1'000'000);

  constexpr int            kThreads = 8;
  constexpr int            kUpdates = 2000;
  std::atomic<bool>        done{false};
  std::atomic<bool>        went_back{false};

  std::thread              reader([&] {
    int64_t last = 0;
    while (!done.load()) {
      for (const auto& entry : table.TakeSnapshot()) {
        if (const auto* w = std::get_if<ActiveWorker>(&entry)) {
          if (w->bytes_done_ < last) went_back = true;
          last = w->bytes_done_;
        }
      }
    }
  });

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      std::mt19937                           rng(static_cast<unsigned>(t));
      std::uniform_int_distribution<int64_t> jitter(0, 500);
      for (int i = 0; i < kUpdates; ++i) {
        table.UpdateProgress(id, job, std::max<int64_t>(0, i * 400 - jitter(rng)));
      }
    });
  }
  for (auto& w : writers) w.join();
  done = true;
  reader.join();

  EXPECT_FALSE(went_back.load());
  auto final_bytes = std::get<ActiveWorker>(*table.Get(id)).bytes_done_;
  EXPECT_LE(final_bytes, int64_t{(kUpdates - 1) * 400});
  EXPECT_GE(final_bytes, int64_t{(kUpdates - 1) * 400 - 500});
}

TEST(WorkerStatusTableTest, StorageSnapshotExpires) {
  auto              now = FromUnix(1'700'000'000);
  WorkerStatusTable table{[&] { return now; }};
  table.Put(Active("rapidgator"));
  auto id = FileHostWorkerId("rapidgator");
  EXPECT_FALSE(table.FreshStorage(id).has_value());

  table.SetStorage(id, StorageSnapshot{int64_t{100}, int64_t{40}, now});
  ASSERT_TRUE(table.FreshStorage(id).has_value());
  EXPECT_EQ(table.FreshStorage(id)->left_.value_or(0), 40);

  now += std::chrono::minutes{31};
  EXPECT_FALSE(table.FreshStorage(id).has_value());
}

TEST(WorkerStatusTableTest, MutationsArePublished) {
  WorkerStatusTable table;
  auto [v0, s0] = table.Channel().Latest();
  table.Put(Active("a"));
  table.SetState(FileHostWorkerId("a"), "uploading");
  auto [v1, s1] = table.Channel().Latest();
  EXPECT_GT(v1, v0);
  ASSERT_TRUE(s1);
  ASSERT_EQ(s1->size(), 1u);
  EXPECT_EQ(std::get<ActiveWorker>(s1->front()).state_, "uploading");
}
}  // namespace imxup
