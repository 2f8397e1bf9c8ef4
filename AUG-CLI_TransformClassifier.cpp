#include "AUG-CLI_TransformClassifier.hpp"

#include <cxxabi.h>

#include <cctype>
#include <cstdlib>
#include <memory>
#include <typeinfo>

using namespace AUG_CLI;

//===================================================================================================================//

TransformKind TransformClassifier::classify(const TransformEntry& entry) {
  return entry.kind();
}

//===================================================================================================================//

std::string TransformClassifier::nameOf(const TransformEntry& entry) {
  return nameOf(entry.transform());
}

//===================================================================================================================//

std::string TransformClassifier::nameOf(const Transform& transform) {
  std::optional<nlohmann::json> info = transform.transformInfo();

  if (info.has_value() && info->is_object() && info->contains("class") && info->at("class").is_string()) {
    std::string name = info->at("class").get<std::string>();
    if (!name.empty()) return name;
  }

  return sanitizeTransformName(demangle(typeid(transform).name()));
}

//===================================================================================================================//

std::string TransformClassifier::sanitizeTransformName(const std::string& typeName) {
  std::string name = typeName;

  // Template arguments
  size_t templateStart = name.find('<');
  if (templateStart != std::string::npos) name = name.substr(0, templateStart);

  // Namespace qualifiers, including "(anonymous namespace)::"
  size_t scope = name.rfind("::");
  if (scope != std::string::npos) name = name.substr(scope + 2);

  const std::string suffix = "Transform";
  if (name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
    name = name.substr(0, name.size() - suffix.size());
  }

  // Keep only characters that are safe in a path segment
  std::string sanitized;
  for (char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') sanitized += c;
  }

  if (sanitized.empty()) return suffix;

  sanitized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(sanitized[0])));
  return sanitized;
}

//===================================================================================================================//

std::string TransformClassifier::kindToName(TransformKind kind) {
  switch (kind) {
    case TransformKind::RANDOMIZABLE:
      return "randomizable";
    case TransformKind::DETERMINISTIC:
      return "deterministic";
  }

  return "deterministic";
}

//===================================================================================================================//

std::string TransformClassifier::demangle(const char* mangledName) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(mangledName, nullptr, nullptr, &status),
                                                    std::free);

  if (status != 0 || !demangled) {
    return mangledName;
  }

  return demangled.get();
}
