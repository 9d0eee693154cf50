#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "queue/host_metrics.hpp"
#include "queue/queue_test_fixation.hpp"

namespace imxup {
class HostMetricsTests : public QueueManagerTests {
 protected:
  // 2026-03-10 12:00:00 UTC
  std::chrono::system_clock::time_point now_ = FromUnix(1'773'144'000);

  void SetUp() override {
    QueueManagerTests::SetUp();
    queue_ = std::make_unique<QueueManager>(db_, BackoffPolicy{}, [this] { return now_; });
  }

  void AdvanceDays(int days) { now_ += std::chrono::days{days}; }
};

TEST(HostMetricsTest, RatesAndDays) {
  HostMetrics metrics;
  EXPECT_DOUBLE_EQ(metrics.SuccessRate(), 100.0);
  metrics.files_uploaded_   = 3;
  metrics.files_failed_     = 1;
  metrics.bytes_uploaded_   = 4000;
  metrics.transfer_seconds_ = 2.0;
  EXPECT_DOUBLE_EQ(metrics.SuccessRate(), 75.0);
  EXPECT_DOUBLE_EQ(metrics.AverageBps(), 2000.0);

  TransferSample instant{"h", 10, 0.0, 1, 0};
  EXPECT_DOUBLE_EQ(instant.Speed(), 10000.0);
  EXPECT_EQ(MetricsDay(FromUnix(1'773'144'000)), "2026-03-10");
}

TEST_F(HostMetricsTests, TransfersAccumulatePerHost) {
  queue_->RecordTransfer({"rapidgator", 1000, 2.0, 1, 0});
  queue_->RecordTransfer({"rapidgator", 0, 1.0, 0, 1});
  queue_->RecordTransfer({"rapidgator", 3000, 1.0, 1, 0});
  queue_->RecordTransfer({"gofile", 50, 1.0, 1, 0});

  auto today = queue_->GetHostMetrics("rapidgator", MetricsPeriod::TODAY);
  EXPECT_EQ(today.bytes_uploaded_, 4000);
  EXPECT_EQ(today.files_uploaded_, 2);
  EXPECT_EQ(today.files_failed_, 1);
  EXPECT_DOUBLE_EQ(today.transfer_seconds_, 4.0);
  EXPECT_DOUBLE_EQ(today.peak_bps_, 3000.0);
  EXPECT_DOUBLE_EQ(today.AverageBps(), 1000.0);

  auto all_time = queue_->GetHostMetrics("rapidgator", MetricsPeriod::ALL_TIME);
  EXPECT_EQ(all_time.bytes_uploaded_, 4000);
  EXPECT_EQ(all_time.period_type_, kAllTimePeriod);

  EXPECT_EQ(queue_->MetricsHosts(), (std::vector<host_id_t>{"gofile", "rapidgator"}));
  EXPECT_EQ(queue_->GetHostMetrics("nobody", MetricsPeriod::WEEK).bytes_uploaded_, 0);
}

TEST_F(HostMetricsTests, PeriodsCoverTheirDays) {
  queue_->RecordTransfer({"rapidgator", 100, 1.0, 1, 0});
  AdvanceDays(5);
  queue_->RecordTransfer({"rapidgator", 200, 1.0, 1, 0});
  AdvanceDays(10);
  queue_->RecordTransfer({"rapidgator", 400, 1.0, 1, 0});

  EXPECT_EQ(queue_->GetHostMetrics("rapidgator", MetricsPeriod::TODAY).bytes_uploaded_, 400);
  EXPECT_EQ(queue_->GetHostMetrics("rapidgator", MetricsPeriod::WEEK).bytes_uploaded_, 400);
  EXPECT_EQ(queue_->GetHostMetrics("rapidgator", MetricsPeriod::MONTH).bytes_uploaded_, 700);
  EXPECT_EQ(queue_->GetHostMetrics("rapidgator", MetricsPeriod::ALL_TIME).bytes_uploaded_, 700);

  auto days = queue_->GetDailyMetrics("rapidgator", 30);
  ASSERT_EQ(days.size(), 3u);
  EXPECT_EQ(days[0].period_date_, "2026-03-25");
  EXPECT_EQ(days[2].period_date_, "2026-03-10");
}

TEST_F(HostMetricsTests, PruneKeepsRunningTotals) {
  queue_->RecordTransfer({"rapidgator", 100, 1.0, 1, 0});
  AdvanceDays(100);
  queue_->RecordTransfer({"rapidgator", 200, 1.0, 1, 0});

  EXPECT_EQ(queue_->PruneMetrics(90), 1);
  EXPECT_EQ(queue_->GetDailyMetrics("rapidgator", 365).size(), 1u);
  EXPECT_EQ(queue_->GetHostMetrics("rapidgator", MetricsPeriod::ALL_TIME).bytes_uploaded_, 300);
  EXPECT_EQ(queue_->PruneMetrics(90), 0);
}
}  // namespace imxup
