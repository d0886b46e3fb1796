#pragma once

#include <cstdint>
#include <string>

// Semantic classes a segmentation model can report. Stored as one byte per pixel
// in label maps (CV_8UC1); Unknown is also the value of every pixel when
// segmentation is disabled or failed.
enum class SemanticClass : std::uint8_t {
  Unknown = 0,
  Sky,
  Water,
  Foliage,
  Skin,
  Ground,
  Building,
  Person,
  Count
};

const char* SemanticClassName(SemanticClass c);

// Case-insensitive lookup ("sky", "Foliage", ...). "background" and "other" map to Unknown.
// Returns false for names that are not recognized.
bool ParseSemanticClass(const std::string& name, SemanticClass& out);
