#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

enum class DitherKernel {
  FloydSteinberg,  // 7/16 right, 3/16 5/16 1/16 below
  SierraLite,      // 2/4 right, 1/4 1/4 below
  Stucki           // 12 taps over two rows below, /42
};

const char* DitherKernelName(DitherKernel kernel);
bool ParseDitherKernel(const std::string& name, DitherKernel& out);

// One destination of a kernel, relative to the current pixel. Only taps to
// pixels later in raster order are allowed (dy > 0, or dy == 0 and dx > 0).
struct KernelTap {
  int dx;
  int dy;
  float weight;
};

// Where a pushed error went.
struct DispersalReport {
  cv::Vec3f distributed;  // sum added to in-image neighbours
  cv::Vec3f dropped;      // sum of fractions whose neighbour lies outside the image
};

// Disperser (error diffusion):
// - Keeps a per-pixel accumulator of quantization error (Lab, CV_32FC3).
// - Push() spreads strength * error over the kernel taps; kernel weights sum to 1,
//   so distributed + dropped always equals strength * error.
// - Consume() returns the error accumulated for a pixel and clears it.
// - Must be driven in raster order (row-major, left to right, top to bottom).
class Disperser {
public:
  // strength in [0, 1]; 0 disables dispersal. Throws ConfigurationError otherwise.
  Disperser(DitherKernel kernel, float strength);

  void Reset(const cv::Size& size);

  cv::Vec3f Consume(int row, int col);
  DispersalReport Push(int row, int col, const cv::Vec3f& error);

  bool Enabled() const { return strength_ > 0.0f; }
  float Strength() const { return strength_; }
  DitherKernel Kernel() const { return kernel_; }

  static const std::vector<KernelTap>& Taps(DitherKernel kernel);

private:
  DitherKernel kernel_;
  float strength_;
  cv::Mat accum_;
};
