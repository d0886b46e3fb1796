#pragma once

#include <stdexcept>
#include <string>

// Stages of a single-image run, used for progress reporting and error context.
enum class Stage {
  Startup,
  Validate,
  Convert,
  Segment,
  Map,
  Render
};

const char* StageName(Stage stage);

// Base of every classified mapping failure.
// Carries the stage and the image identifier so callers can diagnose a failed run.
class MappingError : public std::runtime_error {
public:
  MappingError(const std::string& message, Stage stage, const std::string& imageId = {});

  Stage GetStage() const { return stage_; }
  const std::string& ImageId() const { return imageId_; }

  // Message without the stage/image prefix.
  const std::string& Detail() const { return detail_; }

private:
  Stage stage_;
  std::string imageId_;
  std::string detail_;
};

// Input image shape or depth not supported. Fatal for that image.
class UnsupportedFormatError : public MappingError {
public:
  using MappingError::MappingError;
};

// Segmentation model failed or produced malformed output.
// Recoverable: the segmentation stage falls back to "all unknown".
class ModelInferenceError : public MappingError {
public:
  using MappingError::MappingError;
};

// Invalid palette table, palette-subset mapping or dithering parameter.
// Fatal at startup, before any image is processed.
class ConfigurationError : public MappingError {
public:
  explicit ConfigurationError(const std::string& message)
      : MappingError(message, Stage::Startup) {}
};

// Buffer allocation failed (or the image exceeds the configured pixel limit).
class ResourceExhaustionError : public MappingError {
public:
  using MappingError::MappingError;
};
