// Repository: encodewatch
// Component: Line Parser Contract Tests
// Purpose: Typed extraction from telemetry lines, including sentinels and malformed input.
// Copyright (c) 2025 encodewatch

#include "encodewatch/progress/LineParser.h"

#include <string>

#include <gtest/gtest.h>

namespace encodewatch::tests {
namespace {

using progress::ParseBitrate;
using progress::ParseFrameRate;
using progress::ParseSpeed;
using progress::ParseTimestampUs;

TEST(LineParserContract, FrameRateAcceptsDecimalAndRational) {
  EXPECT_DOUBLE_EQ(ParseFrameRate("24/1"), 24.0);
  EXPECT_NEAR(ParseFrameRate("24000/1001"), 23.976, 1e-3);
  EXPECT_DOUBLE_EQ(ParseFrameRate("24000/1001"), 24000.0 / 1001.0);
  EXPECT_NEAR(ParseFrameRate("23.976"), 23.976, 1e-9);
  EXPECT_DOUBLE_EQ(ParseFrameRate(" 30 "), 30.0);
}

TEST(LineParserContract, FrameRateRejectsDegenerateInput) {
  EXPECT_EQ(ParseFrameRate("24/0"), 0.0);
  EXPECT_EQ(ParseFrameRate("24/-1"), 0.0);
  EXPECT_EQ(ParseFrameRate(""), 0.0);
  EXPECT_EQ(ParseFrameRate("abc/1"), 0.0);
  EXPECT_EQ(ParseFrameRate("24/x"), 0.0);
  EXPECT_EQ(ParseFrameRate("fast"), 0.0);
}

TEST(LineParserContract, SpeedParsesMultiplier) {
  auto speed = ParseSpeed("speed=1.5x");
  ASSERT_TRUE(speed.has_value());
  EXPECT_TRUE(speed->available);
  EXPECT_DOUBLE_EQ(speed->value, 1.5);
  EXPECT_EQ(speed->raw, "1.5x");

  speed = ParseSpeed("speed=2.34x");
  ASSERT_TRUE(speed.has_value());
  EXPECT_DOUBLE_EQ(speed->value, 2.34);
}

TEST(LineParserContract, SpeedWhitespacePaddingIsIgnored) {
  const auto plain = ParseSpeed("speed=1.5x");
  const auto padded = ParseSpeed("speed=   1.5x   ");
  ASSERT_TRUE(plain.has_value());
  ASSERT_TRUE(padded.has_value());
  EXPECT_DOUBLE_EQ(plain->value, padded->value);
  EXPECT_EQ(plain->raw, padded->raw);
  EXPECT_EQ(plain->available, padded->available);
}

TEST(LineParserContract, SpeedNotAvailableIsTaggedNotZero) {
  const auto speed = ParseSpeed("speed=N/A");
  ASSERT_TRUE(speed.has_value()) << "N/A is a recognised token, not a parse failure";
  EXPECT_FALSE(speed->available);
  EXPECT_EQ(speed->value, 0.0);
  EXPECT_EQ(speed->raw, "N/A");
}

TEST(LineParserContract, SpeedRejectsMalformedTokens) {
  EXPECT_FALSE(ParseSpeed("speed=-1.5x").has_value());
  EXPECT_FALSE(ParseSpeed("speed=fast").has_value());
  EXPECT_FALSE(ParseSpeed("speed=1.5").has_value());
  EXPECT_FALSE(ParseSpeed("speed=x").has_value());
  EXPECT_FALSE(ParseSpeed("bitrate=1.5x").has_value());
  EXPECT_FALSE(ParseSpeed("").has_value());
}

TEST(LineParserContract, BitrateCapturedVerbatim) {
  for (const char* token : {"1234kbits/s", "1.2Mbits/s", "3.5Gbits/s", "800bits/s"}) {
    SCOPED_TRACE(token);
    const auto bitrate = ParseBitrate(std::string("bitrate=") + token);
    ASSERT_TRUE(bitrate.has_value());
    EXPECT_TRUE(bitrate->available);
    EXPECT_EQ(bitrate->raw, token);
  }
}

TEST(LineParserContract, BitrateUnitPrefixIsCaseInsensitive) {
  const auto lower = ParseBitrate("bitrate=1.2mbits/s");
  ASSERT_TRUE(lower.has_value());
  EXPECT_EQ(lower->raw, "1.2mbits/s");
  const auto upper = ParseBitrate("bitrate=1234Kbits/s");
  ASSERT_TRUE(upper.has_value());
  EXPECT_EQ(upper->raw, "1234Kbits/s");
}

TEST(LineParserContract, BitrateNotAvailable) {
  const auto bitrate = ParseBitrate("bitrate=N/A");
  ASSERT_TRUE(bitrate.has_value());
  EXPECT_FALSE(bitrate->available);
  EXPECT_EQ(bitrate->raw, "N/A");
}

TEST(LineParserContract, BitrateRejectsGarbage) {
  EXPECT_FALSE(ParseBitrate("bitrate=fast").has_value());
  EXPECT_FALSE(ParseBitrate("bitrate=1234kb").has_value());
  EXPECT_FALSE(ParseBitrate("bitrate=").has_value());
  EXPECT_FALSE(ParseBitrate("bitrate=1234.5KBITS/S").has_value()) << "only the prefix ignores case";
}

TEST(LineParserContract, TimestampConvertsToMicroseconds) {
  EXPECT_EQ(ParseTimestampUs("00:00:04.166667"), 4'166'667);
  EXPECT_EQ(ParseTimestampUs("01:02:03"), (3600 + 120 + 3) * 1'000'000LL);
  EXPECT_EQ(ParseTimestampUs("00:00:01.5"), 1'500'000);
  EXPECT_EQ(ParseTimestampUs("00:00:01.1234567"), 1'123'456) << "fraction truncated to 6 digits";
  EXPECT_EQ(ParseTimestampUs("00:00:00.000000"), 0);
}

TEST(LineParserContract, TimestampStructuralFailuresReturnSentinel) {
  EXPECT_LT(ParseTimestampUs("00:01"), 0);
  EXPECT_LT(ParseTimestampUs("00:00:01:02"), 0);
  EXPECT_LT(ParseTimestampUs("aa:00:01"), 0);
  EXPECT_LT(ParseTimestampUs("00:00:01.x"), 0);
  EXPECT_LT(ParseTimestampUs("-1:00:00"), 0);
  EXPECT_LT(ParseTimestampUs("N/A"), 0);
  EXPECT_LT(ParseTimestampUs(""), 0);
}

TEST(LineParserContract, TimestampBeyondMicrosecondRangeReturnsSentinel) {
  EXPECT_EQ(ParseTimestampUs("9999999999999:00:00"), progress::kInvalidTimestampUs);
  EXPECT_EQ(ParseTimestampUs("00:99999999999999999:00"), progress::kInvalidTimestampUs);
  EXPECT_EQ(ParseTimestampUs("2562047789:00:00"), progress::kInvalidTimestampUs);
  EXPECT_EQ(ParseTimestampUs("2562047788:00:00.5"), 2'562'047'788LL * 3600 * 1'000'000 + 500'000);
}

TEST(LineParserContract, KeyValueSplitsOnFirstEquals) {
  std::string key;
  std::string value;
  ASSERT_TRUE(progress::ParseKeyValue(" out_time = 00:00:01.000000 ", key, value));
  EXPECT_EQ(key, "out_time");
  EXPECT_EQ(value, "00:00:01.000000");

  ASSERT_TRUE(progress::ParseKeyValue("a=b=c", key, value));
  EXPECT_EQ(key, "a");
  EXPECT_EQ(value, "b=c");

  EXPECT_FALSE(progress::ParseKeyValue("no separator", key, value));
  EXPECT_FALSE(progress::ParseKeyValue("=value", key, value));
}

TEST(LineParserContract, NumericParsersRequireFullConsumption) {
  EXPECT_EQ(progress::ParseInt64("42"), 42);
  EXPECT_FALSE(progress::ParseInt64("42abc").has_value());
  EXPECT_FALSE(progress::ParseInt64("99999999999999999999").has_value());
  EXPECT_FALSE(progress::ParseDouble("1.5x").has_value());
  EXPECT_FALSE(progress::ParseDouble("nan").has_value());
  EXPECT_FALSE(progress::ParseDouble("inf").has_value());
}

// Rejects a sample exactly when at least one component is negative.
TEST(LineParserContract, ValidateSampleRejectsAnyNegative) {
  const int64_t frames[] = {-1, 0, 10};
  const double fps[] = {-0.5, 0.0, 24.0};
  const int64_t sizes[] = {-1, 0, 4096};
  for (int64_t f : frames) {
    for (double r : fps) {
      for (int64_t s : sizes) {
        const bool any_negative = f < 0 || r < 0.0 || s < 0;
        EXPECT_EQ(progress::ValidateSample(f, r, s), !any_negative)
            << "frame=" << f << " fps=" << r << " size=" << s;
      }
    }
  }
}

}  // namespace
}  // namespace encodewatch::tests
