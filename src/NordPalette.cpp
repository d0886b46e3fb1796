#include "NordPalette.h"
#include "ColorSpaceConverter.h"
#include "MappingErrors.h"

#include <stdexcept>

const std::vector<PaletteTableRow>& NordPalette::CanonicalTable() {
  // Reference: https://www.nordtheme.com/docs/colors-and-palettes
  static const std::vector<PaletteTableRow> table = {
    // Polar Night
    {0, "nord0", 0x2E3440},
    {1, "nord1", 0x3B4252},
    {2, "nord2", 0x434C5E},
    {3, "nord3", 0x4C566A},
    // Snow Storm
    {4, "nord4", 0xD8DEE9},
    {5, "nord5", 0xE5E9F0},
    {6, "nord6", 0xECEFF4},
    // Frost
    {7, "nord7", 0x8FBCBB},
    {8, "nord8", 0x88C0D0},
    {9, "nord9", 0x81A1C1},
    {10, "nord10", 0x5E81AC},
    // Aurora
    {11, "nord11", 0xBF616A},
    {12, "nord12", 0xD08770},
    {13, "nord13", 0xEBCB8B},
    {14, "nord14", 0xA3BE8C},
    {15, "nord15", 0xB48EAD},
  };
  return table;
}

NordPalette::NordPalette() : NordPalette(CanonicalTable()) {}

NordPalette::NordPalette(const std::vector<PaletteTableRow>& table) {
  if (table.size() != static_cast<size_t>(kPaletteSize)) {
    throw ConfigurationError("palette table must have exactly " + std::to_string(kPaletteSize) +
                             " entries, got " + std::to_string(table.size()));
  }

  entries_.resize(kPaletteSize);
  PaletteSubset seen;
  for (const PaletteTableRow& row : table) {
    if (row.id < 0 || row.id >= kPaletteSize) {
      throw ConfigurationError("palette id out of range: " + std::to_string(row.id));
    }
    if (seen.test(row.id)) {
      throw ConfigurationError("duplicate palette id: " + std::to_string(row.id));
    }
    seen.set(row.id);

    Entry& e = entries_[row.id];
    e.id = row.id;
    e.name = row.name ? row.name : ("nord" + std::to_string(row.id));
    e.bgr = cv::Vec3b(
        static_cast<uchar>(row.rgb & 0xFF),
        static_cast<uchar>((row.rgb >> 8) & 0xFF),
        static_cast<uchar>((row.rgb >> 16) & 0xFF));
    e.lab = ColorSpaceConverter::ToLab(e.bgr);
  }
}

const NordPalette::Entry& NordPalette::At(int id) const {
  if (id < 0 || id >= Size()) {
    throw std::out_of_range("palette id out of range: " + std::to_string(id));
  }
  return entries_[id];
}

int NordPalette::IdOf(const cv::Vec3b& bgr) const {
  for (const Entry& e : entries_) {
    if (e.bgr == bgr) return e.id;
  }
  return -1;
}

int NordPalette::IdOf(const std::string& name) const {
  for (const Entry& e : entries_) {
    if (e.name == name) return e.id;
  }
  return -1;
}
