#pragma once

#include "NordPalette.h"

#include <opencv2/core.hpp>

// Distance of a color to the palette entry it was resolved to.
struct Match {
  int id = 0;
  float distance = 0.0f;  // Euclidean distance in Lab, >= 0
};

// NearestPaletteResolver:
// - Finds the closest palette entry to a Lab color (Euclidean distance, i.e. CIE76 delta E).
// - Entries closer than kTieEpsilon to the best distance count as ties; ties go to the
//   lowest palette id so results never depend on iteration details.
// - Pure; holds only a reference to the shared palette.
class NearestPaletteResolver {
public:
  static constexpr float kTieEpsilon = 1e-4f;

  explicit NearestPaletteResolver(const NordPalette& palette) : palette_(palette) {}

  // Candidates are restricted to |subset|; an empty subset means the full palette.
  Match Resolve(const cv::Vec3f& lab, const PaletteSubset& subset = PaletteSubset()) const;

  const NordPalette& Palette() const { return palette_; }

  static float Distance(const cv::Vec3f& a, const cv::Vec3f& b);

private:
  const NordPalette& palette_;
};
