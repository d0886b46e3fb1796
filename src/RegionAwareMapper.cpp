#include "RegionAwareMapper.h"

#include <initializer_list>

namespace {
PaletteSubset SubsetOf(std::initializer_list<int> ids) {
  PaletteSubset s;
  for (int id : ids) s.set(id);
  return s;
}
} // namespace

ClassPreferences ClassPreferences::Defaults() {
  ClassPreferences p;
  // Snow storm (4..6) + frost (7..10)
  p.Set(SemanticClass::Sky, SubsetOf({4, 5, 6, 7, 8, 9, 10}));
  // Polar night (0..3) + frost
  p.Set(SemanticClass::Water, SubsetOf({0, 1, 2, 3, 7, 8, 9, 10}));
  // Green, teal frost, yellow + polar night for shadows
  p.Set(SemanticClass::Foliage, SubsetOf({0, 1, 2, 3, 7, 13, 14}));
  // Aurora warm tones + snow storm for highlights
  p.Set(SemanticClass::Skin, SubsetOf({4, 5, 6, 11, 12, 13, 15}));
  return p;
}

void ClassPreferences::Set(SemanticClass c, const PaletteSubset& subset) {
  subsets_[static_cast<size_t>(c)] = subset;
}

void ClassPreferences::Clear(SemanticClass c) {
  subsets_[static_cast<size_t>(c)].reset();
}

const PaletteSubset& ClassPreferences::Get(SemanticClass c) const {
  return subsets_[static_cast<size_t>(c)];
}

SemanticClass RegionAwareMapper::LabelAt(const cv::Mat& labels, int row, int col) {
  if (labels.empty()) return SemanticClass::Unknown;
  const uchar v = labels.at<uchar>(row, col);
  if (v >= static_cast<uchar>(SemanticClass::Count)) return SemanticClass::Unknown;
  return static_cast<SemanticClass>(v);
}

PixelMapping RegionAwareMapper::MapPixel(const cv::Vec3f& lab, SemanticClass label) const {
  if (label >= SemanticClass::Count) label = SemanticClass::Unknown;

  PixelMapping out;
  out.match = resolver_.Resolve(lab, preferences_.Get(label));
  out.error = lab - resolver_.Palette().At(out.match.id).lab;
  return out;
}
