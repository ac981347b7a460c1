// Repository: encodewatch
// Component: Display Format Contract Tests
// Purpose: Human-readable sizes, durations, placeholders and the 99.9% display cap.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/DisplayFormat.h"

#include <string>

#include <gtest/gtest.h>

#include "encodewatch/progress/ProgressStore.h"

namespace encodewatch::tests {
namespace {

using progress::FormatBitrate;
using progress::FormatBytes;
using progress::FormatDuration;
using progress::FormatEta;
using progress::FormatPercentage;
using progress::FormatSize;
using progress::FormatSpeed;
using progress::kCalculatingPlaceholder;
using progress::kPlaceholder;
using progress::ProgressSnapshot;
using progress::TelemetryToken;

TEST(DisplayFormatContract, BytesUseBinaryUnits) {
  EXPECT_EQ(FormatBytes(0), "0 B");
  EXPECT_EQ(FormatBytes(1023), "1023 B");
  EXPECT_EQ(FormatBytes(1024), "1.0 KiB");
  EXPECT_EQ(FormatBytes(1536), "1.5 KiB");
  EXPECT_EQ(FormatBytes(1024 * 1024), "1.0 MiB");
  EXPECT_EQ(FormatBytes(1024LL * 1024 * 1024), "1.0 GiB");
  EXPECT_EQ(FormatBytes(5LL * 1024 * 1024 * 1024 * 1024), "5.0 TiB");
}

TEST(DisplayFormatContract, DurationRoundsToSeconds) {
  EXPECT_EQ(FormatDuration(0), "0:00");
  EXPECT_EQ(FormatDuration(38'200'000), "0:38");
  EXPECT_EQ(FormatDuration(59'600'000), "1:00");
  EXPECT_EQ(FormatDuration(3'599'000'000), "59:59");
  EXPECT_EQ(FormatDuration(3'723'000'000), "1:02:03");
  EXPECT_EQ(FormatDuration(-1), kPlaceholder);
}

TEST(DisplayFormatContract, EtaPlaceholderWhenUnavailable) {
  EXPECT_EQ(FormatEta(progress::kEtaUnavailableUs, false), kPlaceholder);
  EXPECT_EQ(FormatEta(38'000'000, false), kPlaceholder);
  EXPECT_EQ(FormatEta(38'000'000, true), "0:38");
}

TEST(DisplayFormatContract, PercentageUnknownShowsCalculating) {
  ProgressSnapshot snapshot;
  snapshot.current_frame = 250;
  EXPECT_EQ(FormatPercentage(snapshot), kCalculatingPlaceholder);
}

TEST(DisplayFormatContract, PercentageKnownTotalWithoutProgressShowsCalculating) {
  ProgressSnapshot snapshot;
  snapshot.total_frames = 1000;
  snapshot.total_duration_us = 40'000'000;
  EXPECT_EQ(FormatPercentage(snapshot), kCalculatingPlaceholder);

  snapshot.elapsed_media_us = 400'000;
  EXPECT_EQ(FormatPercentage(snapshot), "0.0%");

  snapshot.elapsed_media_us = 0;
  snapshot.current_frame = 10;
  snapshot.completion_percent = 1.0;
  EXPECT_EQ(FormatPercentage(snapshot), "1.0%");
}

TEST(DisplayFormatContract, PercentageCappedBelowHundredForDisplayOnly) {
  ProgressSnapshot snapshot;
  snapshot.total_frames = 1000;
  snapshot.current_frame = 999;
  snapshot.completion_percent = 100.0;
  EXPECT_EQ(FormatPercentage(snapshot), "99.9%");
  EXPECT_DOUBLE_EQ(snapshot.completion_percent, 100.0);

  snapshot.completion_percent = 42.26;
  EXPECT_EQ(FormatPercentage(snapshot), "42.3%");

  snapshot.completion_percent = 0.0;
  EXPECT_EQ(FormatPercentage(snapshot), "0.0%");
}

TEST(DisplayFormatContract, TelemetryTokens) {
  TelemetryToken speed;
  EXPECT_EQ(FormatSpeed(speed), kPlaceholder);
  speed.raw = "N/A";
  EXPECT_EQ(FormatSpeed(speed), "N/A");
  speed.available = true;
  speed.raw = "0x";
  EXPECT_EQ(FormatSpeed(speed), kPlaceholder);
  speed.raw = "0.00x";
  EXPECT_EQ(FormatSpeed(speed), kPlaceholder) << "zero multiplier, however it is spelled";
  speed.raw = "1.2x";
  speed.value = 1.2;
  EXPECT_EQ(FormatSpeed(speed), "1.2x");

  TelemetryToken bitrate;
  bitrate.available = true;
  bitrate.raw = "1234kbits/s";
  EXPECT_EQ(FormatBitrate(bitrate), "1234kbits/s");
}

TEST(DisplayFormatContract, SizePlaceholderForZero) {
  EXPECT_EQ(FormatSize(0), kPlaceholder);
  EXPECT_EQ(FormatSize(2048), "2.0 KiB");
}

TEST(DisplayFormatContract, StatusLineShowsCompletionAndError) {
  progress::SessionState state;
  state.progress.current_frame = 1000;
  state.progress.total_frames = 1000;
  state.progress.completion_percent = 100.0;
  state.done = true;
  EXPECT_EQ(progress::FormatStatusLine(state).rfind("100.0%", 0), 0u);

  state.error = "encoder exit status 1";
  const std::string failed = progress::FormatStatusLine(state);
  EXPECT_EQ(failed.rfind("99.9%", 0), 0u);
  EXPECT_NE(failed.find("error: encoder exit status 1"), std::string::npos);
}

}  // namespace
}  // namespace encodewatch::tests
