#include "MappingConfig.h"
#include "MappingErrors.h"
#include "NordPalette.h"

#include <cmath>
#include <limits>

namespace {
bool ReadBool(const cv::FileNode& node) {
  if (node.isString()) {
    const std::string s = node.string();
    return s == "true" || s == "yes" || s == "on" || s == "1";
  }
  return static_cast<int>(node) != 0;
}

std::vector<std::string> ReadStrings(const cv::FileNode& node, const std::string& key) {
  if (!node.isSeq()) {
    throw ConfigurationError("'" + key + "' must be a sequence of strings");
  }
  std::vector<std::string> out;
  for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
    const cv::FileNode item = *it;
    if (!item.isString()) {
      throw ConfigurationError("'" + key + "' must contain only strings");
    }
    out.push_back(item.string());
  }
  return out;
}

std::vector<int> ReadInts(const cv::FileNode& node, const std::string& key) {
  if (!node.isSeq()) {
    throw ConfigurationError("'" + key + "' must be a sequence of integers");
  }
  std::vector<int> out;
  for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
    const cv::FileNode item = *it;
    if (!item.isInt()) {
      throw ConfigurationError("'" + key + "' must contain only integers");
    }
    out.push_back(static_cast<int>(item));
  }
  return out;
}

double ReadReal(const cv::FileNode& node, const std::string& key) {
  if (!node.isReal() && !node.isInt()) {
    throw ConfigurationError("'" + key + "' must be a number");
  }
  return node.real();
}

// Whole numbers only; FileStorage hands large or exponent-form values back as reals.
int ReadInt(const cv::FileNode& node, const std::string& key) {
  if (node.isInt()) return static_cast<int>(node);
  if (!node.isReal()) {
    throw ConfigurationError("'" + key + "' must be an integer");
  }
  const double v = node.real();
  if (!std::isfinite(v) || v != std::floor(v) ||
      v < static_cast<double>(std::numeric_limits<int>::min()) ||
      v > static_cast<double>(std::numeric_limits<int>::max())) {
    throw ConfigurationError("'" + key + "' must be an integer in int range");
  }
  return static_cast<int>(v);
}

void ReadSegmentation(const cv::FileNode& node, MappingConfig::Segmentation& seg) {
  if (!node.isMap()) {
    throw ConfigurationError("'segmentation' must be a map");
  }
  if (!node["enabled"].empty()) seg.enabled = ReadBool(node["enabled"]);
  if (!node["model"].empty()) seg.modelPath = node["model"].string();
  if (!node["input_width"].empty()) seg.inputWidth = ReadInt(node["input_width"], "input_width");
  if (!node["input_height"].empty()) seg.inputHeight = ReadInt(node["input_height"], "input_height");
  if (!node["scale"].empty()) seg.scale = ReadReal(node["scale"], "scale");
  if (!node["swap_rb"].empty()) seg.swapRB = ReadBool(node["swap_rb"]);
  if (!node["timeout_ms"].empty()) seg.timeoutMs = ReadInt(node["timeout_ms"], "timeout_ms");
  if (!node["classes"].empty()) seg.classes = ReadStrings(node["classes"], "classes");

  const cv::FileNode mean = node["mean"];
  if (!mean.empty()) {
    if (!mean.isSeq() || mean.size() != 3) {
      throw ConfigurationError("'mean' must be a sequence of 3 numbers");
    }
    seg.mean = cv::Scalar(ReadReal(mean[0], "mean"), ReadReal(mean[1], "mean"), ReadReal(mean[2], "mean"));
  }
}
} // namespace

MappingConfig MappingConfig::Load(const std::string& path) {
  MappingConfig cfg;

  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
      throw ConfigurationError("cannot open config file '" + path + "'");
    }
    const cv::FileNode root = fs.root();

    if (!root["dither_strength"].empty()) {
      cfg.ditherStrength = static_cast<float>(ReadReal(root["dither_strength"], "dither_strength"));
    }
    if (!root["dither_kernel"].empty()) {
      const std::string name = root["dither_kernel"].string();
      if (!ParseDitherKernel(name, cfg.ditherKernel)) {
        throw ConfigurationError("unknown dither kernel '" + name + "'");
      }
    }
    if (!root["segmentation"].empty()) {
      ReadSegmentation(root["segmentation"], cfg.segmentation);
    }

    const cv::FileNode overrides = root["class_overrides"];
    if (!overrides.empty()) {
      if (!overrides.isMap()) {
        throw ConfigurationError("'class_overrides' must be a map");
      }
      for (const std::string& key : overrides.keys()) {
        cfg.classOverrides[key] = ReadInts(overrides[key], "class_overrides." + key);
      }
    }

    if (!root["background"].empty()) cfg.background = root["background"].string();
    if (!root["max_pixels"].empty()) cfg.maxPixels = ReadInt(root["max_pixels"], "max_pixels");
    if (!root["auto_adjust"].empty()) cfg.autoAdjust = ReadBool(root["auto_adjust"]);
    if (!root["brightness_threshold"].empty()) {
      cfg.brightnessThreshold = static_cast<float>(ReadReal(root["brightness_threshold"], "brightness_threshold"));
    }
  } catch (const cv::Exception& e) {
    throw ConfigurationError("cannot parse config file '" + path + "': " + e.what());
  }

  cfg.Validate();
  return cfg;
}

void MappingConfig::Validate() const {
  if (!std::isfinite(ditherStrength) || ditherStrength < 0.0f || ditherStrength > 1.0f) {
    throw ConfigurationError("dither_strength must be in [0, 1]");
  }
  if (maxPixels <= 0) {
    throw ConfigurationError("max_pixels must be positive");
  }
  if (!std::isfinite(brightnessThreshold) || brightnessThreshold < 0.0f || brightnessThreshold > 1.0f) {
    throw ConfigurationError("brightness_threshold must be in [0, 1]");
  }
  if (!background.empty()) {
    RgbColor::FromHex(background);
  }

  for (const auto& kv : classOverrides) {
    SemanticClass c;
    if (!ParseSemanticClass(kv.first, c)) {
      throw ConfigurationError("unknown class '" + kv.first + "' in class_overrides");
    }
    if (kv.second.empty()) {
      throw ConfigurationError("class_overrides." + kv.first + " is empty");
    }
    for (int id : kv.second) {
      if (id < 0 || id >= kPaletteSize) {
        throw ConfigurationError("class_overrides." + kv.first + " has palette id " + std::to_string(id) +
                                 " outside 0.." + std::to_string(kPaletteSize - 1));
      }
    }
  }

  if (segmentation.enabled) {
    if (segmentation.modelPath.empty()) {
      throw ConfigurationError("segmentation is enabled but no model is set");
    }
    if (segmentation.inputWidth <= 0 || segmentation.inputHeight <= 0) {
      throw ConfigurationError("segmentation input size must be positive");
    }
    if (segmentation.classes.empty()) {
      throw ConfigurationError("segmentation is enabled but no classes are listed");
    }
    if (!std::isfinite(segmentation.scale) || segmentation.scale <= 0.0) {
      throw ConfigurationError("segmentation scale must be positive");
    }
    if (segmentation.timeoutMs < 0) {
      throw ConfigurationError("segmentation timeout_ms must not be negative");
    }
  }
  // Class names are checked even when disabled so a typo is caught before it matters.
  ModelClasses();
}

std::vector<SemanticClass> MappingConfig::ModelClasses() const {
  std::vector<SemanticClass> out;
  out.reserve(segmentation.classes.size());
  for (const std::string& name : segmentation.classes) {
    SemanticClass c;
    if (!ParseSemanticClass(name, c)) {
      throw ConfigurationError("unknown segmentation class '" + name + "'");
    }
    out.push_back(c);
  }
  return out;
}

ClassPreferences MappingConfig::BuildPreferences() const {
  ClassPreferences prefs = ClassPreferences::Defaults();
  for (const auto& kv : classOverrides) {
    SemanticClass c;
    if (!ParseSemanticClass(kv.first, c)) {
      throw ConfigurationError("unknown class '" + kv.first + "' in class_overrides");
    }
    PaletteSubset subset;
    for (int id : kv.second) {
      if (id < 0 || id >= kPaletteSize) {
        throw ConfigurationError("palette id out of range in class_overrides." + kv.first);
      }
      subset.set(id);
    }
    if (subset.none()) {
      throw ConfigurationError("class_overrides." + kv.first + " is empty");
    }
    prefs.Set(c, subset);
  }
  return prefs;
}

std::optional<RgbColor> MappingConfig::Background() const {
  if (background.empty()) return std::nullopt;
  return RgbColor::FromHex(background);
}
