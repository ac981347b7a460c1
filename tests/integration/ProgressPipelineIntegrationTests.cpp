// Repository: encodewatch
// Component: Progress Pipeline Integration Tests
// Purpose: Telemetry and diagnostic text driven through accumulator, pumps and store.
// Copyright (c) 2025 encodewatch

#include <fcntl.h>
#include <unistd.h>

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "encodewatch/encode/StreamPump.h"
#include "encodewatch/progress/BatchAccumulator.h"
#include "encodewatch/progress/DisplayFormat.h"
#include "encodewatch/progress/ProgressStore.h"
#include "timing/TestMasterClock.h"

namespace encodewatch::tests {
namespace {

using encode::LineReader;
using encode::StreamPump;
using encode::UniqueFd;
using progress::FrameEstimate;
using progress::kEtaUnavailableUs;

constexpr int64_t kStartUs = 1'700'000'000'000'000;

const std::vector<std::string> kFirstBatch = {
    "frame=100",
    "fps=24",
    "bitrate=1234kbits/s",
    "total_size=5000000",
    "out_time_us=4166667",
    "speed=1.2x",
    "progress=continue",
};

// Read end of a pipe whose write end already carries `text` and is closed.
UniqueFd PipeWith(const std::string& text) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    ADD_FAILURE() << "pipe2 failed";
    return UniqueFd();
  }
  UniqueFd read_end(fds[0]);
  UniqueFd write_end(fds[1]);
  size_t written = 0;
  while (written < text.size()) {
    const ssize_t n = ::write(write_end.get(), text.data() + written, text.size() - written);
    if (n <= 0) {
      ADD_FAILURE() << "short write to pipe";
      break;
    }
    written += static_cast<size_t>(n);
  }
  return read_end;
}

class ProgressPipelineTest : public ::testing::Test {
 protected:
  ProgressPipelineTest()
      : clock_(std::make_shared<timing::TestMasterClock>(kStartUs)), store_(clock_) {}

  void Estimate(int64_t total_frames, bool estimated, int64_t duration_us, double fps) {
    FrameEstimate estimate;
    estimate.source = estimated ? FrameEstimate::Source::kDuration
                                : FrameEstimate::Source::kContainerCount;
    estimate.total_frames = total_frames;
    estimate.estimated = estimated;
    estimate.total_duration_us = duration_us;
    estimate.source_fps = fps;
    store_.ApplyEstimate(estimate);
  }

  void Feed(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
      if (auto batch = accumulator_.Feed(line)) {
        store_.ApplyBatch(*batch);
      }
    }
  }

  void BeginRunPastWarmup() {
    store_.BeginRun();
    clock_->AdvanceSeconds(6.0);
  }

  std::shared_ptr<timing::TestMasterClock> clock_;
  progress::ProgressStore store_;
  progress::BatchAccumulator accumulator_;
};

TEST_F(ProgressPipelineTest, FirstBatchWithEstimatedTotalUsesMediaTime) {
  Estimate(1000, /*estimated=*/true, 50'000'000, 20.0);
  BeginRunPastWarmup();
  Feed(kFirstBatch);

  const auto p = store_.Progress();
  EXPECT_EQ(p.current_frame, 100);
  EXPECT_DOUBLE_EQ(p.current_fps, 24.0);
  EXPECT_EQ(p.bitrate.raw, "1234kbits/s");
  EXPECT_TRUE(p.bitrate.available);
  EXPECT_EQ(p.total_output_bytes, 5'000'000);
  EXPECT_EQ(p.elapsed_media_us, 4'166'667);
  EXPECT_DOUBLE_EQ(p.last_valid_speed, 1.2);

  // Extrapolated totals defer to the container duration.
  EXPECT_NEAR(p.completion_percent, 8.333334, 1e-5);

  // (50 s - 4.166667 s) / 1.2, first sample stored as is.
  ASSERT_TRUE(p.eta_available);
  EXPECT_EQ(p.eta_us, 38'194'444);
}

TEST_F(ProgressPipelineTest, FirstBatchWithExactTotalUsesFrames) {
  Estimate(1000, /*estimated=*/false, 50'000'000, 20.0);
  BeginRunPastWarmup();
  Feed(kFirstBatch);

  const auto p = store_.Progress();
  EXPECT_NEAR(p.completion_percent, 10.0, 1e-9);
  ASSERT_TRUE(p.eta_available);
  EXPECT_EQ(p.eta_us, 38'194'444);
  EXPECT_EQ(progress::FormatPercentage(p), "10.0%");
}

TEST_F(ProgressPipelineTest, UnknownTotalsReportUnknownPercent) {
  BeginRunPastWarmup();
  Feed({"frame=240", "fps=24", "out_time_us=10000000", "speed=1.0x", "progress=continue"});

  const auto p = store_.Progress();
  EXPECT_EQ(p.current_frame, 240);
  EXPECT_FALSE(p.PercentKnown());
  EXPECT_EQ(progress::FormatPercentage(p), progress::kCalculatingPlaceholder);
  EXPECT_FALSE(p.eta_available);

  store_.ApplyDiagnosticLine("  Duration: 00:00:40.00, start: 0.000000, bitrate: 900 kb/s");
  const auto after = store_.Progress();
  EXPECT_TRUE(after.PercentKnown());
  EXPECT_NEAR(after.completion_percent, 25.0, 1e-9);
}

TEST_F(ProgressPipelineTest, TerminalBatchCorrectsUnderestimatedTotal) {
  Estimate(950, /*estimated=*/true, 38'000'000, 25.0);
  BeginRunPastWarmup();
  Feed(kFirstBatch);
  Feed({"frame=1000", "out_time_us=40000000", "progress=end"});

  const auto p = store_.Progress();
  EXPECT_EQ(p.current_frame, 1000);
  EXPECT_EQ(p.total_frames, 1000);
  EXPECT_FALSE(p.frame_count_estimated);
  EXPECT_DOUBLE_EQ(p.completion_percent, 100.0);
  EXPECT_FALSE(p.eta_available);
  EXPECT_EQ(p.eta_us, kEtaUnavailableUs);
}

TEST_F(ProgressPipelineTest, EtaStaysUnavailableDuringWarmup) {
  Estimate(1000, /*estimated=*/false, 50'000'000, 20.0);
  store_.BeginRun();
  clock_->AdvanceSeconds(2.0);
  Feed(kFirstBatch);

  const auto p = store_.Progress();
  EXPECT_FALSE(p.eta_available);
  EXPECT_EQ(progress::FormatEta(p.eta_us, p.eta_available), progress::kPlaceholder);
}

TEST(LineReaderIntegration, SplitsOnNewlinesAndCarriageReturns) {
  UniqueFd fd = PipeWith("alpha\nbeta\r\rgamma\r\n\ndelta");
  LineReader reader(fd.get());

  std::vector<std::string> lines;
  while (auto line = reader.NextLine()) {
    lines.push_back(*line);
  }
  EXPECT_EQ(lines, (std::vector<std::string>{"alpha", "beta", "gamma", "delta"}));
  EXPECT_TRUE(reader.error().empty());
}

TEST(StreamPumpIntegration, TelemetryStreamIsAppliedInBatches) {
  auto clock = std::make_shared<timing::TestMasterClock>(kStartUs);
  progress::ProgressStore store(clock);

  std::string text;
  for (const auto& line : kFirstBatch) {
    text += line + "\n";
  }
  text += "frame=200\nfps=25\nprogress=continue\nframe=300\n";

  StreamPump pump(StreamPump::Kind::kTelemetry, PipeWith(text), store);
  ASSERT_TRUE(pump.Start());
  pump.Join();

  EXPECT_EQ(pump.lines_read(), 11u);
  EXPECT_EQ(store.batches_applied(), 3u);  // two boundaries plus the flushed tail
  const auto p = store.Progress();
  EXPECT_EQ(p.current_frame, 300);
  EXPECT_DOUBLE_EQ(p.current_fps, 25.0);
  EXPECT_EQ(p.total_output_bytes, 5'000'000);
}

TEST(StreamPumpIntegration, DiagnosticStreamFeedsHintsAndLog) {
  auto clock = std::make_shared<timing::TestMasterClock>(kStartUs);
  progress::ProgressStore store(clock);

  const std::string text =
      "Input #0, matroska,webm, from 'in.mkv':\n"
      "  Duration: 00:01:00.00, start: 0.000000, bitrate: 4000 kb/s\n"
      "    Stream #0:0: Video: h264 (High), yuv420p, 1920x1080, 25 fps, 25 tbr, 1k tbn\n"
      "frame=  100 fps= 24 q=30.0 size=    1024kB time=00:00:04.00 bitrate=2097.2kbits/s\r"
      "frame=  200 fps= 24 q=30.0 size=    2048kB time=00:00:08.00 bitrate=2097.2kbits/s\r";

  StreamPump pump(StreamPump::Kind::kDiagnostics, PipeWith(text), store);
  ASSERT_TRUE(pump.Start());
  pump.Join();

  const auto state = store.Snapshot();
  EXPECT_EQ(state.progress.total_duration_us, 60'000'000);
  EXPECT_DOUBLE_EQ(state.progress.source_fps, 25.0);
  EXPECT_EQ(state.progress.total_frames, 1500);
  EXPECT_TRUE(state.progress.frame_count_estimated);
  ASSERT_EQ(state.log.size(), 3u);
  EXPECT_EQ(state.log[0], "Input #0, matroska,webm, from 'in.mkv':");
}

}  // namespace
}  // namespace encodewatch::tests
