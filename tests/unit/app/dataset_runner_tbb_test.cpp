#ifdef SPECSYNTH_HAS_TBB

#include <specsynth/app/config.hpp>
#include <specsynth/app/dataset_runner.hpp>
#include <specsynth/app/dataset_runner_tbb.hpp>
#include <specsynth/core/error.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <atomic>
#include <map>
#include <mutex>

namespace sa = specsynth::app;

namespace {

sa::DatasetConfig small_config() {
  sa::DatasetConfig cfg = sa::default_config();
  cfg.fchans = 128;
  cfg.tchans = 8;
  cfg.num_frames = 8;
  cfg.edge_margin = 16;
  return cfg;
}

}  // namespace

TEST(DatasetRunnerTbbTest, CallbackPerFrame) {
  std::atomic<std::size_t> calls{0};
  auto count = sa::generate_dataset_tbb(small_config(), [&calls](const sa::LabeledFrame&) { calls++; });
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 8u);
  EXPECT_EQ(calls.load(), 8u);
}

TEST(DatasetRunnerTbbTest, MatchesSequentialOutput) {
  const sa::DatasetConfig cfg = small_config();
  std::map<std::uint64_t, cv::Mat> sequential;
  ASSERT_TRUE(sa::generate_dataset(cfg, [&sequential](const sa::LabeledFrame& f) {
    sequential[f.frame_id] = f.frame.data().clone();
  }).has_value());

  std::mutex mutex;
  std::map<std::uint64_t, cv::Mat> parallel;
  ASSERT_TRUE(sa::generate_dataset_tbb(cfg, [&](const sa::LabeledFrame& f) {
    std::lock_guard lock(mutex);
    parallel[f.frame_id] = f.frame.data().clone();
  }).has_value());
  ASSERT_EQ(parallel.size(), sequential.size());
  for (const auto& [id, data] : sequential) {
    EXPECT_DOUBLE_EQ(cv::norm(data, parallel.at(id), cv::NORM_INF), 0.0) << id;
  }
}

TEST(DatasetRunnerTbbTest, InvalidConfigRejected) {
  sa::DatasetConfig cfg = small_config();
  cfg.tchans = 0;
  std::atomic<std::size_t> calls{0};
  auto count = sa::generate_dataset_tbb(cfg, [&calls](const sa::LabeledFrame&) { calls++; });
  ASSERT_FALSE(count.has_value());
  EXPECT_EQ(count.error(), specsynth::core::SynthError::InvalidConfig);
  EXPECT_EQ(calls.load(), 0u);
}

#endif  // SPECSYNTH_HAS_TBB
