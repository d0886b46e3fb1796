#include "Disperser.h"
#include "MappingErrors.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace {
const DitherKernel kAllKernels[] = {DitherKernel::FloydSteinberg, DitherKernel::SierraLite, DitherKernel::Stucki};

void ExpectVecNear(const cv::Vec3f& a, const cv::Vec3f& b, float tol = 1e-4f) {
  for (int i = 0; i < 3; ++i) EXPECT_NEAR(a[i], b[i], tol) << "component " << i;
}
} // namespace

TEST(Disperser, KernelWeightsSumToOne) {
  for (DitherKernel k : kAllKernels) {
    float sum = 0.0f;
    for (const KernelTap& t : Disperser::Taps(k)) sum += t.weight;
    EXPECT_NEAR(sum, 1.0f, 1e-6f) << DitherKernelName(k);
  }
}

TEST(Disperser, KernelsOnlyReachPixelsLaterInRasterOrder) {
  for (DitherKernel k : kAllKernels) {
    for (const KernelTap& t : Disperser::Taps(k)) {
      EXPECT_TRUE(t.dy > 0 || (t.dy == 0 && t.dx > 0)) << DitherKernelName(k);
    }
  }
}

TEST(Disperser, InteriorPixelDistributesTheWholeError) {
  const cv::Vec3f error(3.0f, -2.0f, 1.5f);
  for (DitherKernel k : kAllKernels) {
    Disperser d(k, 1.0f);
    d.Reset(cv::Size(5, 5));
    const DispersalReport r = d.Push(2, 2, error);
    ExpectVecNear(r.distributed, error);
    ExpectVecNear(r.dropped, cv::Vec3f(0.0f, 0.0f, 0.0f));
  }
}

TEST(Disperser, LastPixelDropsEverything) {
  const cv::Vec3f error(4.0f, 1.0f, -8.0f);
  for (DitherKernel k : kAllKernels) {
    Disperser d(k, 1.0f);
    d.Reset(cv::Size(3, 3));
    const DispersalReport r = d.Push(2, 2, error);
    ExpectVecNear(r.distributed, cv::Vec3f(0.0f, 0.0f, 0.0f));
    ExpectVecNear(r.dropped, error);
  }
}

TEST(Disperser, RightEdgeDropsOnlyOutOfImageFractions) {
  Disperser d(DitherKernel::FloydSteinberg, 1.0f);
  d.Reset(cv::Size(3, 3));
  const cv::Vec3f error(16.0f, 16.0f, 16.0f);

  const DispersalReport r = d.Push(0, 2, error);
  // Right (7/16) and down-right (1/16) fall outside.
  ExpectVecNear(r.dropped, error * (8.0f / 16.0f));
  ExpectVecNear(r.distributed, error * (8.0f / 16.0f));
  ExpectVecNear(d.Consume(1, 1), error * (3.0f / 16.0f));
  ExpectVecNear(d.Consume(1, 2), error * (5.0f / 16.0f));
}

TEST(Disperser, StrengthScalesTheDisplacedError) {
  Disperser d(DitherKernel::SierraLite, 0.5f);
  d.Reset(cv::Size(4, 4));
  const cv::Vec3f error(10.0f, -4.0f, 2.0f);

  const DispersalReport r = d.Push(3, 0, error);
  ExpectVecNear(r.distributed + r.dropped, error * 0.5f);
}

TEST(Disperser, ConsumeReturnsAndClearsTheAccumulator) {
  Disperser d(DitherKernel::FloydSteinberg, 1.0f);
  d.Reset(cv::Size(3, 3));
  const cv::Vec3f error(16.0f, 0.0f, -16.0f);

  d.Push(0, 0, error);
  ExpectVecNear(d.Consume(0, 1), error * (7.0f / 16.0f));
  ExpectVecNear(d.Consume(0, 1), cv::Vec3f(0.0f, 0.0f, 0.0f));
}

TEST(Disperser, ResetClearsPendingError) {
  Disperser d(DitherKernel::FloydSteinberg, 1.0f);
  d.Reset(cv::Size(3, 3));
  d.Push(0, 0, cv::Vec3f(5.0f, 5.0f, 5.0f));
  d.Reset(cv::Size(3, 3));
  ExpectVecNear(d.Consume(0, 1), cv::Vec3f(0.0f, 0.0f, 0.0f));
}

TEST(Disperser, ZeroStrengthDisablesDispersal) {
  Disperser d(DitherKernel::Stucki, 0.0f);
  EXPECT_FALSE(d.Enabled());
  d.Reset(cv::Size(5, 5));
  const DispersalReport r = d.Push(0, 0, cv::Vec3f(9.0f, 9.0f, 9.0f));
  ExpectVecNear(r.distributed, cv::Vec3f(0.0f, 0.0f, 0.0f));
  ExpectVecNear(r.dropped, cv::Vec3f(0.0f, 0.0f, 0.0f));
  ExpectVecNear(d.Consume(0, 1), cv::Vec3f(0.0f, 0.0f, 0.0f));
}

TEST(Disperser, RejectsStrengthOutsideUnitRange) {
  EXPECT_THROW(Disperser(DitherKernel::FloydSteinberg, -0.1f), ConfigurationError);
  EXPECT_THROW(Disperser(DitherKernel::FloydSteinberg, 1.5f), ConfigurationError);
  EXPECT_THROW(Disperser(DitherKernel::FloydSteinberg, std::numeric_limits<float>::quiet_NaN()),
               ConfigurationError);
}

TEST(Disperser, ParsesKernelNames) {
  DitherKernel k = DitherKernel::Stucki;
  EXPECT_TRUE(ParseDitherKernel("Floyd-Steinberg", k));
  EXPECT_EQ(k, DitherKernel::FloydSteinberg);
  EXPECT_TRUE(ParseDitherKernel("sierra_lite", k));
  EXPECT_EQ(k, DitherKernel::SierraLite);
  EXPECT_TRUE(ParseDitherKernel("STUCKI", k));
  EXPECT_EQ(k, DitherKernel::Stucki);
  EXPECT_FALSE(ParseDitherKernel("atkinson", k));
}
