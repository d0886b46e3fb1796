#pragma once

#include <opencv2/core.hpp>
#include <string>

// ImageLoader: decode/encode boundary of the tool.
// The mapping core only sees cv::Mat buffers; files are read and written here.
class ImageLoader {
public:
  // Loads an image without conversion (IMREAD_UNCHANGED) so BGRA inputs keep their
  // alpha channel. Returns true on success.
  static bool Load(const std::string& path, cv::Mat& outImage, std::string& outError);

  // Saves 8-bit BGR/BGRA images using OpenCV imwrite. The format follows the file
  // extension; PNG is written at full compression and WebP losslessly.
  static bool Save(const std::string& path, const cv::Mat& image, std::string& outError);
};
