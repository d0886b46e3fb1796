#pragma once

#include <opencv2/core.hpp>

// ColorSpaceConverter:
// - Moves pixels between the native 8-bit BGR(A) representation and CIE L*a*b*.
// - Lab is used for every distance comparison because Euclidean distance there
//   follows perceived color difference far better than distance in RGB.
// - Float Lab (CV_32FC3): L in [0, 100], a and b roughly in [-128, 127].
class ColorSpaceConverter {
public:
  // Throws UnsupportedFormatError unless the image is CV_8UC3 (BGR) or CV_8UC4 (BGRA).
  static void CheckFormat(const cv::Mat& image);

  // 8-bit BGR/BGRA -> CV_32FC3 Lab. Alpha is ignored.
  static cv::Mat ToLab(const cv::Mat& image);

  // CV_32FC3 Lab -> CV_8UC3 BGR, rounded and saturated.
  static cv::Mat FromLab(const cv::Mat& lab);

  static cv::Vec3f ToLab(const cv::Vec3b& bgr);
  static cv::Vec3b FromLab(const cv::Vec3f& lab);

  // Clamp to the representable Lab range.
  static cv::Vec3f ClampLab(const cv::Vec3f& lab);

  static constexpr float kMinL = 0.0f;
  static constexpr float kMaxL = 100.0f;
  static constexpr float kMinAB = -128.0f;
  static constexpr float kMaxAB = 127.0f;
};
