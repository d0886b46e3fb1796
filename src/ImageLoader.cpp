#include "ImageLoader.h"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace {
// Palette output has few distinct colors, so maximum PNG compression stays cheap.
// WebP quality above 100 selects the lossless coder; lossy coders would blend
// neighbouring palette colors.
std::vector<int> EncoderParams(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (ext == ".png") return {cv::IMWRITE_PNG_COMPRESSION, 9};
  if (ext == ".webp") return {cv::IMWRITE_WEBP_QUALITY, 101};
  if (ext == ".jpg" || ext == ".jpeg") return {cv::IMWRITE_JPEG_QUALITY, 100};
  return {};
}
} // namespace

bool ImageLoader::Load(const std::string& path, cv::Mat& outImage, std::string& outError) {
  outError.clear();
  outImage.release();

  cv::Mat img;
  try {
    img = cv::imread(path, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  if (img.empty()) {
    outError = "Failed to load image '" + path + "' (empty). Check path and supported formats.";
    return false;
  }
  outImage = img;
  return true;
}

bool ImageLoader::Save(const std::string& path, const cv::Mat& image, std::string& outError) {
  outError.clear();
  if (image.empty()) {
    outError = "Nothing to save (image is empty).";
    return false;
  }
  if (image.depth() != CV_8U || (image.channels() != 3 && image.channels() != 4)) {
    outError = "Refusing to save '" + path + "': expected an 8-bit BGR or BGRA image.";
    return false;
  }
  try {
    if (!cv::imwrite(path, image, EncoderParams(path))) {
      outError = "No encoder accepted '" + path + "'. Check the file extension and that the directory exists.";
      return false;
    }
  } catch (const cv::Exception& e) {
    outError = std::string("OpenCV error: ") + e.what();
    return false;
  }
  return true;
}
