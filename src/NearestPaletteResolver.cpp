#include "NearestPaletteResolver.h"

#include <algorithm>
#include <cmath>
#include <limits>

float NearestPaletteResolver::Distance(const cv::Vec3f& a, const cv::Vec3f& b) {
  const float dl = a[0] - b[0];
  const float da = a[1] - b[1];
  const float db = a[2] - b[2];
  return std::sqrt(dl * dl + da * da + db * db);
}

Match NearestPaletteResolver::Resolve(const cv::Vec3f& lab, const PaletteSubset& subset) const {
  const bool restricted = subset.any();
  const std::vector<NordPalette::Entry>& entries = palette_.Entries();

  float distances[kPaletteSize];
  float minDist = std::numeric_limits<float>::max();
  for (const NordPalette::Entry& e : entries) {
    if (restricted && !subset.test(e.id)) continue;
    distances[e.id] = Distance(lab, e.lab);
    minDist = std::min(minDist, distances[e.id]);
  }

  // Lowest id within the epsilon band of the minimum.
  Match best;
  best.id = -1;
  for (const NordPalette::Entry& e : entries) {
    if (restricted && !subset.test(e.id)) continue;
    if (distances[e.id] <= minDist + kTieEpsilon) {
      best.id = e.id;
      best.distance = distances[e.id];
      break;
    }
  }
  return best;
}
