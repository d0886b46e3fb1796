#include "MappingErrors.h"

namespace {
std::string FormatMessage(const std::string& message, Stage stage, const std::string& imageId) {
  std::string out = "[";
  out += StageName(stage);
  if (!imageId.empty()) {
    out += " ";
    out += imageId;
  }
  out += "] ";
  out += message;
  return out;
}
} // namespace

const char* StageName(Stage stage) {
  switch (stage) {
    case Stage::Startup: return "startup";
    case Stage::Validate: return "validate";
    case Stage::Convert: return "convert";
    case Stage::Segment: return "segment";
    case Stage::Map: return "map";
    case Stage::Render: return "render";
  }
  return "unknown";
}

MappingError::MappingError(const std::string& message, Stage stage, const std::string& imageId)
    : std::runtime_error(FormatMessage(message, stage, imageId)),
      stage_(stage),
      imageId_(imageId),
      detail_(message) {}
