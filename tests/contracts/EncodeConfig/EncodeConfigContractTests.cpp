// Repository: encodewatch
// Component: Encode Config Contract Tests
// Purpose: Defaults, profiles, option overlay and the ffmpeg argument vector.
// Copyright (c) 2025 encodewatch

#include "encodewatch/encode/EncodeConfig.h"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace encodewatch::tests {
namespace {

using encode::EncodeConfig;

// Returns the value following `flag`, or "" when absent.
std::string ValueAfter(const std::vector<std::string>& args, const std::string& flag) {
  const auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end()) {
    return std::string();
  }
  return *(it + 1);
}

int CountMapsOf(const std::vector<std::string>& args, const std::string& value) {
  int count = 0;
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "-map" && args[i + 1] == value) ++count;
  }
  return count;
}

TEST(EncodeConfigContract, DefaultsMatchSvtAv1HdrRecommendations) {
  const EncodeConfig cfg;
  EXPECT_EQ(cfg.crf, 35);
  EXPECT_EQ(cfg.preset, 4);
  EXPECT_EQ(cfg.tune, 1);
  EXPECT_TRUE(cfg.variance_boost);
  EXPECT_EQ(cfg.variance_boost_strength, 2);
  EXPECT_EQ(cfg.sharpness, 1);
  EXPECT_EQ(cfg.tf_strength, 1);
  EXPECT_EQ(cfg.film_grain, 0);
  EXPECT_EQ(cfg.max_size_percent, 0);
  EXPECT_EQ(cfg.min_bitrate_kbps, 0);
  EXPECT_EQ(cfg.remove_image_codecs, (std::vector<std::string>{"mjpeg", "png"}));
}

TEST(EncodeConfigContract, ArgumentsCarryTelemetryContract) {
  const EncodeConfig cfg;
  const auto args = cfg.BuildFFmpegArgs("in.mkv", "in.av1.mkv");

  ASSERT_GE(args.size(), 4u);
  EXPECT_EQ(args[0], "-hide_banner");
  EXPECT_EQ(ValueAfter(args, "-progress"), "pipe:1");
  EXPECT_EQ(ValueAfter(args, "-i"), "in.mkv");
  EXPECT_EQ(args.back(), "in.av1.mkv");
  EXPECT_EQ(args[args.size() - 2], "-y");
}

TEST(EncodeConfigContract, ArgumentsEncodeWithSvtAv1) {
  EncodeConfig cfg;
  cfg.crf = 30;
  cfg.preset = 6;
  const auto args = cfg.BuildFFmpegArgs("in.mkv", "out.mkv");

  EXPECT_EQ(ValueAfter(args, "-c:v"), "libsvtav1");
  EXPECT_EQ(ValueAfter(args, "-crf"), "30");
  EXPECT_EQ(ValueAfter(args, "-preset"), "6");
  EXPECT_EQ(ValueAfter(args, "-g"), "240");
  EXPECT_EQ(ValueAfter(args, "-keyint_min"), "48");
  EXPECT_EQ(ValueAfter(args, "-pix_fmt"), "yuv420p10le");
  EXPECT_EQ(ValueAfter(args, "-c:a"), "copy");
  EXPECT_EQ(ValueAfter(args, "-c:s"), "copy");
  EXPECT_EQ(ValueAfter(args, "-svtav1-params"),
            "tune=1:enable-variance-boost=1:variance-boost-strength=2:sharpness=1:"
            "enable-tf=1:film-grain=0");
}

TEST(EncodeConfigContract, StreamRemovalMaps) {
  EncodeConfig cfg;
  cfg.remove_languages = {"ger", "fre"};
  const auto args = cfg.BuildFFmpegArgs("in.mkv", "out.mkv");

  EXPECT_EQ(CountMapsOf(args, "0"), 1);
  EXPECT_EQ(CountMapsOf(args, "-0:d"), 1);
  EXPECT_EQ(CountMapsOf(args, "-0:a:m:language:ger"), 1);
  EXPECT_EQ(CountMapsOf(args, "-0:s:m:language:ger"), 1);
  EXPECT_EQ(CountMapsOf(args, "-0:a:m:language:fre"), 1);
  EXPECT_EQ(CountMapsOf(args, "-0:v:m:codec_name:mjpeg"), 1);
  EXPECT_EQ(CountMapsOf(args, "-0:v:m:codec_name:png"), 1);
}

TEST(EncodeConfigContract, OutputPathReplacesExtension) {
  EXPECT_EQ(encode::OutputPathFor("movie.mkv"), "movie.av1.mkv");
  EXPECT_EQ(encode::OutputPathFor("/media/show/ep01.mp4"), "/media/show/ep01.av1.mkv");
  EXPECT_EQ(encode::OutputPathFor("noext"), "noext.av1.mkv");
}

TEST(EncodeConfigContract, ProfilesAreListedAndResolvable) {
  const auto& names = encode::AvailableProfiles();
  EXPECT_EQ(names, (std::vector<std::string>{"default", "quality", "podcast", "compress",
                                             "extreme", "film"}));
  for (const auto& name : names) {
    EncodeConfig cfg;
    EXPECT_TRUE(encode::GetProfile(name, &cfg)) << name;
    EXPECT_FALSE(encode::ProfileDescription(name).empty()) << name;
  }
  EXPECT_TRUE(encode::GetProfile("QUALITY", nullptr));
  EXPECT_FALSE(encode::GetProfile("ultra", nullptr));
  EXPECT_TRUE(encode::ProfileDescription("ultra").empty());
}

TEST(EncodeConfigContract, ProfilesDifferFromDefault) {
  EncodeConfig quality;
  ASSERT_TRUE(encode::GetProfile("quality", &quality));
  EXPECT_LT(quality.crf, EncodeConfig().crf);

  EncodeConfig compress;
  ASSERT_TRUE(encode::GetProfile("compress", &compress));
  EXPECT_GT(compress.max_size_percent, 0);

  EncodeConfig film;
  ASSERT_TRUE(encode::GetProfile("film", &film));
  EXPECT_GT(film.film_grain, 0);
}

TEST(EncodeConfigContract, ApplyOptionsOverlaysValues) {
  EncodeConfig cfg;
  std::string error;
  ASSERT_TRUE(cfg.ApplyOptions({{"crf", "28"},
                                {"variance_boost", "false"},
                                {"ac_bias", "0.8"},
                                {"remove_languages", "ger, fre ,"},
                                {"remove_image_codecs", ""},
                                {"min_bitrate_kbps", "1500"}},
                               &error))
      << error;
  EXPECT_EQ(cfg.crf, 28);
  EXPECT_FALSE(cfg.variance_boost);
  EXPECT_DOUBLE_EQ(cfg.ac_bias, 0.8);
  EXPECT_EQ(cfg.remove_languages, (std::vector<std::string>{"ger", "fre"}));
  EXPECT_TRUE(cfg.remove_image_codecs.empty());
  EXPECT_EQ(cfg.min_bitrate_kbps, 1500);
}

TEST(EncodeConfigContract, ApplyOptionsReportsUnknownKey) {
  EncodeConfig cfg;
  std::string error;
  EXPECT_FALSE(cfg.ApplyOptions({{"bogus", "1"}}, &error));
  EXPECT_NE(error.find("bogus"), std::string::npos);
}

TEST(EncodeConfigContract, ApplyOptionsRejectsOutOfRangeValues) {
  EncodeConfig cfg;
  std::string error;
  EXPECT_FALSE(cfg.ApplyOptions({{"crf", "64"}}, &error));
  EXPECT_FALSE(cfg.ApplyOptions({{"preset", "fast"}}, &error));
  EXPECT_FALSE(cfg.ApplyOptions({{"sharp_tx", "maybe"}}, &error));
  EXPECT_FALSE(cfg.ApplyOptions({{"max_size_percent", "-5"}}, &error));
  EXPECT_EQ(cfg.crf, 35) << "rejected values leave the field untouched";
  EXPECT_NE(error.find("max_size_percent"), std::string::npos);
}

}  // namespace
}  // namespace encodewatch::tests
