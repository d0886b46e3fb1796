#pragma once

#include "NearestPaletteResolver.h"
#include "NordPalette.h"
#include "SemanticClass.h"

#include <array>
#include <opencv2/core.hpp>

// Per-class candidate subsets. An empty subset means "whole palette".
class ClassPreferences {
public:
  // No preferences at all: every class maps against the full palette.
  ClassPreferences() = default;

  // Built-in table: cool frost/snow for sky, frost/polar night for water,
  // greens for foliage and warm aurora tones for skin.
  static ClassPreferences Defaults();

  void Set(SemanticClass c, const PaletteSubset& subset);
  void Clear(SemanticClass c);
  const PaletteSubset& Get(SemanticClass c) const;

private:
  std::array<PaletteSubset, static_cast<size_t>(SemanticClass::Count)> subsets_{};
};

// Result of mapping one pixel.
struct PixelMapping {
  Match match;
  cv::Vec3f error;  // original Lab - chosen Lab
};

// RegionAwareMapper:
// - Resolves one pixel against the candidate set of its semantic class.
// - Pixels are independent here; neighbouring pixels only interact through the Disperser.
class RegionAwareMapper {
public:
  RegionAwareMapper(const NordPalette& palette, const ClassPreferences& preferences)
      : resolver_(palette), preferences_(preferences) {}

  PixelMapping MapPixel(const cv::Vec3f& lab, SemanticClass label) const;

  // Label stored in a label map cell; out-of-range bytes count as Unknown.
  static SemanticClass LabelAt(const cv::Mat& labels, int row, int col);

  const NearestPaletteResolver& Resolver() const { return resolver_; }

private:
  NearestPaletteResolver resolver_;
  ClassPreferences preferences_;
};
