#include "SemanticClass.h"

#include <algorithm>
#include <cctype>

const char* SemanticClassName(SemanticClass c) {
  switch (c) {
    case SemanticClass::Unknown: return "unknown";
    case SemanticClass::Sky: return "sky";
    case SemanticClass::Water: return "water";
    case SemanticClass::Foliage: return "foliage";
    case SemanticClass::Skin: return "skin";
    case SemanticClass::Ground: return "ground";
    case SemanticClass::Building: return "building";
    case SemanticClass::Person: return "person";
    default: break;
  }
  return "unknown";
}

bool ParseSemanticClass(const std::string& name, SemanticClass& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

  if (lower == "background" || lower == "other") {
    out = SemanticClass::Unknown;
    return true;
  }
  for (int i = 0; i < static_cast<int>(SemanticClass::Count); ++i) {
    const SemanticClass c = static_cast<SemanticClass>(i);
    if (lower == SemanticClassName(c)) {
      out = c;
      return true;
    }
  }
  return false;
}
