// Repository: encodewatch
// Component: Encode Configuration
// Purpose: SVT-AV1 encoder options, named profiles and the ffmpeg command line.
// Copyright (c) 2025 encodewatch

#include "encodewatch/encode/EncodeConfig.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <sstream>

#include "encodewatch/progress/LineParser.h"

namespace encodewatch::encode {

namespace {

constexpr int kKeyframeInterval = 240;
constexpr int kMinKeyframeInterval = 48;
constexpr char kVideoCodec[] = "libsvtav1";
constexpr char kPixelFormat[] = "yuv420p10le";

struct ProfileEntry {
  const char* name;
  const char* description;
};

const ProfileEntry kProfiles[] = {
    {"default", "SVT-AV1-HDR defaults, balanced quality and speed"},
    {"quality", "Lower CRF and slower preset for archival quality"},
    {"podcast", "Aggressive compression for mostly static talking-head video"},
    {"compress", "Smaller output, rejected above 50% of the source size"},
    {"extreme", "Maximum compression, rejected above 30% of the source size"},
    {"film", "Film grain tuning and synthesis for grainy film sources"},
};

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> items;
  std::stringstream stream(text);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = progress::Trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

std::optional<bool> ParseBool(const std::string& text) {
  const std::string value = ToLower(progress::Trim(text));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

bool ParseIntInRange(const std::string& text, int lo, int hi, int* out) {
  const auto parsed = progress::ParseInt64(progress::Trim(text));
  if (!parsed || *parsed < lo || *parsed > hi) {
    return false;
  }
  *out = static_cast<int>(*parsed);
  return true;
}

}  // namespace

bool EncodeConfig::ApplyOptions(const std::map<std::string, std::string>& options,
                                std::string* error) {
  constexpr int kIntMax = std::numeric_limits<int>::max();

  for (const auto& [key, value] : options) {
    bool ok = true;
    if (key == "crf") {
      ok = ParseIntInRange(value, 0, 63, &crf);
    } else if (key == "preset") {
      ok = ParseIntInRange(value, 0, 13, &preset);
    } else if (key == "tune") {
      ok = ParseIntInRange(value, 0, 4, &tune);
    } else if (key == "variance_boost" || key == "sharp_tx") {
      const auto parsed = ParseBool(value);
      ok = parsed.has_value();
      if (ok) {
        (key == "variance_boost" ? variance_boost : sharp_tx) = *parsed;
      }
    } else if (key == "variance_boost_strength") {
      ok = ParseIntInRange(value, 1, 4, &variance_boost_strength);
    } else if (key == "sharpness") {
      ok = ParseIntInRange(value, 0, 2, &sharpness);
    } else if (key == "tf_strength") {
      ok = ParseIntInRange(value, 0, 4, &tf_strength);
    } else if (key == "kf_tf_strength") {
      ok = ParseIntInRange(value, 0, 4, &kf_tf_strength);
    } else if (key == "ac_bias") {
      const auto parsed = progress::ParseDouble(progress::Trim(value));
      ok = parsed.has_value() && *parsed >= 0.0;
      if (ok) {
        ac_bias = *parsed;
      }
    } else if (key == "film_grain") {
      ok = ParseIntInRange(value, 0, 50, &film_grain);
    } else if (key == "max_size_percent") {
      ok = ParseIntInRange(value, 0, kIntMax, &max_size_percent);
    } else if (key == "min_bitrate_kbps") {
      ok = ParseIntInRange(value, 0, kIntMax, &min_bitrate_kbps);
    } else if (key == "remove_languages") {
      remove_languages = SplitList(value);
    } else if (key == "remove_image_codecs") {
      remove_image_codecs = SplitList(value);
    } else {
      if (error) {
        *error = "unknown option '" + key + "'";
      }
      return false;
    }

    if (!ok) {
      if (error) {
        *error = "invalid value '" + value + "' for option '" + key + "'";
      }
      return false;
    }
  }
  return true;
}

std::string EncodeConfig::SvtParams() const {
  std::ostringstream params;
  params << "tune=" << tune
         << ":enable-variance-boost=" << (variance_boost ? 1 : 0)
         << ":variance-boost-strength=" << variance_boost_strength
         << ":sharpness=" << sharpness
         << ":enable-tf=" << tf_strength
         << ":film-grain=" << film_grain;
  return params.str();
}

std::vector<std::string> EncodeConfig::BuildFFmpegArgs(const std::string& input_path,
                                                       const std::string& output_path) const {
  std::vector<std::string> args = {
      "-hide_banner",
      "-progress", "pipe:1",
      "-i", input_path,
      "-map", "0",
      "-map", "-0:d",
  };

  for (const auto& lang : remove_languages) {
    args.push_back("-map");
    args.push_back("-0:a:m:language:" + lang);
    args.push_back("-map");
    args.push_back("-0:s:m:language:" + lang);
  }

  for (const auto& codec : remove_image_codecs) {
    args.push_back("-map");
    args.push_back("-0:v:m:codec_name:" + codec);
  }

  const std::vector<std::string> video = {
      "-c:v", kVideoCodec,
      "-crf", std::to_string(crf),
      "-preset", std::to_string(preset),
      "-g", std::to_string(kKeyframeInterval),
      "-keyint_min", std::to_string(kMinKeyframeInterval),
      "-pix_fmt", kPixelFormat,
      "-svtav1-params", SvtParams(),
      "-c:a", "copy",
      "-c:s", "copy",
      "-y",
      output_path,
  };
  args.insert(args.end(), video.begin(), video.end());
  return args;
}

std::string OutputPathFor(const std::string& input_path) {
  std::filesystem::path path(input_path);
  path.replace_extension(".av1.mkv");
  return path.string();
}

const std::vector<std::string>& AvailableProfiles() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& entry : kProfiles) {
      out.emplace_back(entry.name);
    }
    return out;
  }();
  return names;
}

bool GetProfile(const std::string& name, EncodeConfig* config) {
  const std::string key = ToLower(name);
  EncodeConfig cfg;

  if (key == "default") {
    // SVT-AV1-HDR defaults.
  } else if (key == "quality") {
    cfg.crf = 28;
    cfg.preset = 3;
  } else if (key == "podcast") {
    cfg.crf = 45;
    cfg.preset = 6;
    cfg.variance_boost = false;
    cfg.tf_strength = 0;
  } else if (key == "compress") {
    cfg.crf = 40;
    cfg.preset = 5;
    cfg.max_size_percent = 50;
  } else if (key == "extreme") {
    cfg.crf = 50;
    cfg.preset = 6;
    cfg.max_size_percent = 30;
  } else if (key == "film") {
    cfg.crf = 30;
    cfg.preset = 3;
    cfg.tune = 4;
    cfg.film_grain = 8;
  } else {
    return false;
  }

  if (config) {
    *config = cfg;
  }
  return true;
}

std::string ProfileDescription(const std::string& name) {
  const std::string key = ToLower(name);
  for (const auto& entry : kProfiles) {
    if (key == entry.name) {
      return entry.description;
    }
  }
  return std::string();
}

}  // namespace encodewatch::encode
