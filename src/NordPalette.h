#pragma once

#include <opencv2/core.hpp>

#include <bitset>
#include <cstdint>
#include <string>
#include <vector>

constexpr int kPaletteSize = 16;

// Set of palette identifiers a pixel may be resolved to. Empty means "no restriction".
using PaletteSubset = std::bitset<kPaletteSize>;

// Row of the static palette table: identifier, name and 0xRRGGBB value.
struct PaletteTableRow {
  int id;
  const char* name;
  std::uint32_t rgb;
};

// NordPalette:
// - The 16 Nord colors (polar night, snow storm, frost, aurora).
// - Lab coordinates are computed once in the constructor and never change.
// - Read-only after construction, so one instance is shared by every run.
class NordPalette {
public:
  struct Entry {
    int id = 0;
    std::string name;
    cv::Vec3b bgr;  // native value written to the output image
    cv::Vec3f lab;  // precomputed perceptual coordinates
  };

  // Builds the canonical Nord palette.
  NordPalette();

  // Builds a palette from an arbitrary table. Throws ConfigurationError if the
  // table does not have exactly 16 rows or contains an id outside 0..15 or a duplicate.
  explicit NordPalette(const std::vector<PaletteTableRow>& table);

  const std::vector<Entry>& Entries() const { return entries_; }
  const Entry& At(int id) const;
  int Size() const { return static_cast<int>(entries_.size()); }

  // Id of the entry whose native value is exactly |bgr|, or -1.
  int IdOf(const cv::Vec3b& bgr) const;

  // Id of an entry by name ("nord0".."nord15"), or -1.
  int IdOf(const std::string& name) const;

  static PaletteSubset FullSubset() { return PaletteSubset().set(); }

  static const std::vector<PaletteTableRow>& CanonicalTable();

private:
  std::vector<Entry> entries_;  // indexed by id
};
