#include "ImageUtils.h"
#include "ColorSpaceConverter.h"
#include "MappingErrors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>

namespace {
int HexDigit(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
  return -1;
}
} // namespace

RgbColor RgbColor::FromHex(const std::string& hex) {
  std::string digits = hex;
  if (!digits.empty() && digits[0] == '#') digits.erase(0, 1);

  if (digits.size() != 6 && digits.size() != 3) {
    throw ConfigurationError("invalid hex color '" + hex + "' (expected #RRGGBB or #RGB)");
  }

  int values[6] = {};
  for (size_t i = 0; i < digits.size(); ++i) {
    values[i] = HexDigit(digits[i]);
    if (values[i] < 0) {
      throw ConfigurationError("invalid hex color '" + hex + "' (non-hex digit)");
    }
  }

  RgbColor c;
  if (digits.size() == 3) {
    // #RGB is shorthand for #RRGGBB
    c.r = static_cast<unsigned char>(values[0] * 17);
    c.g = static_cast<unsigned char>(values[1] * 17);
    c.b = static_cast<unsigned char>(values[2] * 17);
  } else {
    c.r = static_cast<unsigned char>(values[0] * 16 + values[1]);
    c.g = static_cast<unsigned char>(values[2] * 16 + values[3]);
    c.b = static_cast<unsigned char>(values[4] * 16 + values[5]);
  }
  return c;
}

std::string RgbColor::ToHex() const {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
  return buf;
}

ImageInformation AnalyzeBrightness(const cv::Mat& image) {
  ColorSpaceConverter::CheckFormat(image);

  const int channels = image.channels();
  ImageInformation info;
  double sum = 0.0;
  double lo = std::numeric_limits<double>::max();
  double hi = 0.0;

  for (int y = 0; y < image.rows; ++y) {
    const uchar* row = image.ptr<uchar>(y);
    for (int x = 0; x < image.cols; ++x) {
      const uchar* px = row + x * channels;
      if (channels == 4 && px[3] == 0) continue;

      const double luma = (0.299 * px[2] + 0.587 * px[1] + 0.114 * px[0]) / 255.0;
      sum += luma;
      lo = std::min(lo, luma);
      hi = std::max(hi, luma);
      ++info.visiblePixels;
    }
  }

  if (info.visiblePixels > 0) {
    info.average = sum / info.visiblePixels;
    info.min = lo;
    info.max = hi;
  }
  return info;
}

float AutoDitherStrength(const ImageInformation& info, float base) {
  const double distance = std::min(0.5, std::abs(info.average - 0.5));
  return static_cast<float>(base * (1.0 - distance));
}

cv::Mat CompositeOver(const cv::Mat& bgra, const RgbColor& background) {
  CV_Assert(bgra.type() == CV_8UC4);

  cv::Mat out(bgra.size(), CV_8UC3);
  const float bg[3] = {static_cast<float>(background.b), static_cast<float>(background.g),
                       static_cast<float>(background.r)};

  for (int y = 0; y < bgra.rows; ++y) {
    const cv::Vec4b* src = bgra.ptr<cv::Vec4b>(y);
    cv::Vec3b* dst = out.ptr<cv::Vec3b>(y);
    for (int x = 0; x < bgra.cols; ++x) {
      const float a = src[x][3] / 255.0f;
      for (int c = 0; c < 3; ++c) {
        dst[x][c] = cv::saturate_cast<uchar>(src[x][c] * a + bg[c] * (1.0f - a));
      }
    }
  }
  return out;
}
