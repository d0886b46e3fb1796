#include "Disperser.h"
#include "MappingErrors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>

const char* DitherKernelName(DitherKernel kernel) {
  switch (kernel) {
    case DitherKernel::FloydSteinberg: return "floyd_steinberg";
    case DitherKernel::SierraLite: return "sierra_lite";
    case DitherKernel::Stucki: return "stucki";
  }
  return "floyd_steinberg";
}

bool ParseDitherKernel(const std::string& name, DitherKernel& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  std::replace(lower.begin(), lower.end(), '-', '_');

  for (DitherKernel k : {DitherKernel::FloydSteinberg, DitherKernel::SierraLite, DitherKernel::Stucki}) {
    if (lower == DitherKernelName(k)) {
      out = k;
      return true;
    }
  }
  return false;
}

const std::vector<KernelTap>& Disperser::Taps(DitherKernel kernel) {
  //    X   7
  //  3 5 1      (/16)
  static const std::vector<KernelTap> floydSteinberg = {
    {1, 0, 7.0f / 16.0f},
    {-1, 1, 3.0f / 16.0f}, {0, 1, 5.0f / 16.0f}, {1, 1, 1.0f / 16.0f},
  };
  //    X 2
  //  1 1        (/4)
  static const std::vector<KernelTap> sierraLite = {
    {1, 0, 2.0f / 4.0f},
    {-1, 1, 1.0f / 4.0f}, {0, 1, 1.0f / 4.0f},
  };
  //        X 8 4
  //    2 4 8 4 2
  //    1 2 4 2 1  (/42)
  static const std::vector<KernelTap> stucki = {
    {1, 0, 8.0f / 42.0f}, {2, 0, 4.0f / 42.0f},
    {-2, 1, 2.0f / 42.0f}, {-1, 1, 4.0f / 42.0f}, {0, 1, 8.0f / 42.0f}, {1, 1, 4.0f / 42.0f}, {2, 1, 2.0f / 42.0f},
    {-2, 2, 1.0f / 42.0f}, {-1, 2, 2.0f / 42.0f}, {0, 2, 4.0f / 42.0f}, {1, 2, 2.0f / 42.0f}, {2, 2, 1.0f / 42.0f},
  };

  switch (kernel) {
    case DitherKernel::SierraLite: return sierraLite;
    case DitherKernel::Stucki: return stucki;
    case DitherKernel::FloydSteinberg: break;
  }
  return floydSteinberg;
}

Disperser::Disperser(DitherKernel kernel, float strength) : kernel_(kernel), strength_(strength) {
  if (!std::isfinite(strength) || strength < 0.0f || strength > 1.0f) {
    throw ConfigurationError("dither strength must be in [0, 1], got " + std::to_string(strength));
  }
}

void Disperser::Reset(const cv::Size& size) {
  accum_.create(size, CV_32FC3);
  accum_.setTo(cv::Scalar::all(0.0));
}

cv::Vec3f Disperser::Consume(int row, int col) {
  cv::Vec3f& cell = accum_.at<cv::Vec3f>(row, col);
  const cv::Vec3f e = cell;
  cell = cv::Vec3f(0.0f, 0.0f, 0.0f);
  return e;
}

DispersalReport Disperser::Push(int row, int col, const cv::Vec3f& error) {
  DispersalReport report;
  report.distributed = cv::Vec3f(0.0f, 0.0f, 0.0f);
  report.dropped = cv::Vec3f(0.0f, 0.0f, 0.0f);
  if (!Enabled()) return report;

  const cv::Vec3f scaled = error * strength_;
  for (const KernelTap& tap : Taps(kernel_)) {
    const cv::Vec3f part = scaled * tap.weight;
    const int x = col + tap.dx;
    const int y = row + tap.dy;

    // Edge pixels drop the fraction instead of wrapping.
    if (x < 0 || x >= accum_.cols || y < 0 || y >= accum_.rows) {
      report.dropped += part;
      continue;
    }
    accum_.at<cv::Vec3f>(y, x) += part;
    report.distributed += part;
  }
  return report;
}
