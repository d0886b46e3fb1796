#pragma once

#include <opencv2/core.hpp>

#include <string>

// 8-bit RGB color, as written in configs and on the command line.
struct RgbColor {
  unsigned char r = 0;
  unsigned char g = 0;
  unsigned char b = 0;

  // Accepts "#RRGGBB", "RRGGBB", "#RGB" and "RGB" (case-insensitive).
  // Throws ConfigurationError on anything else.
  static RgbColor FromHex(const std::string& hex);

  std::string ToHex() const;  // "#rrggbb"
  cv::Vec3b ToBgr() const { return cv::Vec3b(b, g, r); }

  bool operator==(const RgbColor& o) const { return r == o.r && g == o.g && b == o.b; }
};

// Perceived brightness statistics, each in [0, 1].
struct ImageInformation {
  double average = 0.0;
  double min = 0.0;
  double max = 0.0;
  int visiblePixels = 0;

  // Position on a 1..9 brightness scale.
  double Score() const { return average * 8.0 + 1.0; }
};

// Rec.601 luma over every pixel that is not fully transparent.
// Input must be CV_8UC3 (BGR) or CV_8UC4 (BGRA); throws UnsupportedFormatError otherwise.
ImageInformation AnalyzeBrightness(const cv::Mat& image);

// Dither strength for one image when options are auto-adjusted. Mid-tone images keep
// |base|; near-black and near-white images, whose pixels sit on the palette extremes,
// fall off linearly to half of it.
float AutoDitherStrength(const ImageInformation& info, float base);

// Blends a BGRA image over a solid background and returns BGR.
// Used when transparent inputs should not keep their alpha channel.
cv::Mat CompositeOver(const cv::Mat& bgra, const RgbColor& background);
