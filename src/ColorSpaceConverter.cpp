#include "ColorSpaceConverter.h"
#include "MappingErrors.h"

#include <algorithm>
#include <string>
#include <opencv2/imgproc.hpp>

void ColorSpaceConverter::CheckFormat(const cv::Mat& image) {
  if (image.empty()) {
    throw UnsupportedFormatError("image is empty", Stage::Validate);
  }
  if (image.depth() != CV_8U) {
    throw UnsupportedFormatError("unsupported bit depth (only 8 bits per channel)", Stage::Validate);
  }
  if (image.channels() != 3 && image.channels() != 4) {
    throw UnsupportedFormatError(
        "unsupported channel count " + std::to_string(image.channels()) + " (expected 3 or 4)",
        Stage::Validate);
  }
}

cv::Mat ColorSpaceConverter::ToLab(const cv::Mat& image) {
  CheckFormat(image);

  cv::Mat bgr;
  if (image.channels() == 4) {
    cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = image;
  }

  // Float input keeps full precision; OpenCV applies the sRGB gamma curve for
  // float Lab conversion, so L lands in [0, 100].
  cv::Mat bgrF;
  bgr.convertTo(bgrF, CV_32F, 1.0 / 255.0);

  cv::Mat lab;
  cv::cvtColor(bgrF, lab, cv::COLOR_BGR2Lab);
  return lab;
}

cv::Mat ColorSpaceConverter::FromLab(const cv::Mat& lab) {
  CV_Assert(lab.type() == CV_32FC3);

  cv::Mat bgrF;
  cv::cvtColor(lab, bgrF, cv::COLOR_Lab2BGR);

  cv::Mat bgr;
  bgrF.convertTo(bgr, CV_8U, 255.0);
  return bgr;
}

cv::Vec3f ColorSpaceConverter::ToLab(const cv::Vec3b& bgr) {
  cv::Mat pixel(1, 1, CV_8UC3, cv::Scalar(bgr[0], bgr[1], bgr[2]));
  return ToLab(pixel).at<cv::Vec3f>(0, 0);
}

cv::Vec3b ColorSpaceConverter::FromLab(const cv::Vec3f& lab) {
  cv::Mat pixel(1, 1, CV_32FC3, cv::Scalar(lab[0], lab[1], lab[2]));
  return FromLab(pixel).at<cv::Vec3b>(0, 0);
}

cv::Vec3f ColorSpaceConverter::ClampLab(const cv::Vec3f& lab) {
  return cv::Vec3f(
      std::max(kMinL, std::min(lab[0], kMaxL)),
      std::max(kMinAB, std::min(lab[1], kMaxAB)),
      std::max(kMinAB, std::min(lab[2], kMaxAB)));
}
