#pragma once

#include "Disperser.h"
#include "ImageUtils.h"
#include "RegionAwareMapper.h"
#include "SemanticClass.h"

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

// MappingConfig:
// - Plain settings with defaults; read once at startup and passed into the orchestrator.
// - Load() reads YAML/JSON/XML through cv::FileStorage; Validate() rejects anything the
//   engine cannot honor before the first image is touched.
struct MappingConfig {
  struct Segmentation {
    bool enabled = false;
    std::string modelPath;           // ONNX file
    int inputWidth = 320;            // fixed model input size
    int inputHeight = 320;
    double scale = 1.0 / 255.0;      // pixel normalization
    cv::Scalar mean{0.0, 0.0, 0.0};  // subtracted before scaling
    bool swapRB = true;
    std::vector<std::string> classes;  // output channel order
    int timeoutMs = 0;                 // 0 = no budget
  };

  float ditherStrength = 1.0f;  // 0 disables dithering
  DitherKernel ditherKernel = DitherKernel::FloydSteinberg;
  Segmentation segmentation;

  // Class name -> palette ids that class may use. Replaces the built-in preference.
  std::map<std::string, std::vector<int>> classOverrides;

  std::string background;  // hex; empty keeps the alpha channel of BGRA inputs
  int maxPixels = 1 << 26;
  float brightnessThreshold = 0.0f;  // images darker than this are skipped by the driver
  bool autoAdjust = false;           // derive each image's dither strength from its brightness

  // Throws ConfigurationError if the file cannot be read or has wrongly typed values.
  // The result is validated.
  static MappingConfig Load(const std::string& path);

  // Throws ConfigurationError describing the first invalid field.
  void Validate() const;

  // Built-in preferences with classOverrides applied.
  ClassPreferences BuildPreferences() const;

  std::vector<SemanticClass> ModelClasses() const;
  std::optional<RgbColor> Background() const;
};
