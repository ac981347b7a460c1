// Repository: encodewatch
// Component: Encode Configuration
// Purpose: SVT-AV1 encoder options, named profiles and the ffmpeg command line.
// Copyright (c) 2025 encodewatch

#ifndef ENCODEWATCH_ENCODE_ENCODE_CONFIG_H_
#define ENCODEWATCH_ENCODE_ENCODE_CONFIG_H_

#include <map>
#include <string>
#include <vector>

namespace encodewatch::encode {

// EncodeConfig holds the encoder settings. Defaults follow the SVT-AV1-HDR
// recommendations.
struct EncodeConfig {
  int crf = 35;                      // 0-63, lower = better quality
  int preset = 4;                    // 0-13, lower = slower
  int tune = 1;                      // 0=VQ 1=PSNR 2=SSIM 3=IQ 4=film grain
  bool variance_boost = true;
  int variance_boost_strength = 2;   // 1-4
  int sharpness = 1;                 // 0-2
  int tf_strength = 1;
  int kf_tf_strength = 1;
  double ac_bias = 1.0;
  bool sharp_tx = true;
  int film_grain = 0;                // 0 = off, 1-50
  int max_size_percent = 0;          // 0 = size check disabled
  std::vector<std::string> remove_languages;
  std::vector<std::string> remove_image_codecs{"mjpeg", "png"};
  int min_bitrate_kbps = 0;          // 0 = no minimum

  // Overlays key=value options (keys are the field names above; list values
  // are comma separated). Stops at the first unknown key or malformed value,
  // describes it in `error` and returns false; fields already applied stay.
  bool ApplyOptions(const std::map<std::string, std::string>& options,
                    std::string* error);

  // Argument vector for ffmpeg (without argv[0]).
  std::vector<std::string> BuildFFmpegArgs(const std::string& input_path,
                                           const std::string& output_path) const;

  // The `-svtav1-params` value.
  std::string SvtParams() const;
};

// Output file next to the input: extension replaced by ".av1.mkv".
std::string OutputPathFor(const std::string& input_path);

// Profiles, in listing order.
const std::vector<std::string>& AvailableProfiles();

// Returns false when `name` is not a known profile (case-insensitive).
bool GetProfile(const std::string& name, EncodeConfig* config);

// One-line description, empty for unknown profiles.
std::string ProfileDescription(const std::string& name);

}  // namespace encodewatch::encode

#endif  // ENCODEWATCH_ENCODE_ENCODE_CONFIG_H_
