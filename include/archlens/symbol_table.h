#pragma once

#include <archlens/models.h>

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace archlens {

// Names the extractor treats specially. Matching is by fully qualified name;
// injection markers also match by simple name.
struct Vocabulary {
  std::string platform_root = "java.lang.Object";
  std::vector<std::string> platform_namespaces;
  std::vector<std::string> value_types;
  std::vector<std::string> container_types;
  std::vector<std::string> injection_markers;
};

Vocabulary DefaultVocabulary();

struct SymbolEntry {
  std::string package;
  TypeKind kind = TypeKind::kClass;
};

class SymbolTable {
public:
  SymbolTable(const std::vector<TypeMetadata> &types, Vocabulary vocabulary);

  bool IsKnown(const std::string &name) const;
  const SymbolEntry *Find(const std::string &name) const;

  bool IsPlatform(std::string_view name) const;
  bool IsPlatformRoot(std::string_view name) const;
  bool IsPrimitive(std::string_view name) const;
  bool IsValueType(std::string_view name) const;
  bool IsContainer(std::string_view name) const;
  bool IsInjectionMarker(std::string_view annotation) const;

  std::size_t size() const { return entries_.size(); }
  const Vocabulary &vocabulary() const { return vocabulary_; }

private:
  std::unordered_map<std::string, SymbolEntry> entries_;
  std::unordered_set<std::string> value_types_;
  std::unordered_set<std::string> container_types_;
  std::unordered_set<std::string> injection_markers_;
  std::unordered_set<std::string> marker_simple_names_;
  Vocabulary vocabulary_;
};

std::string PackageOf(std::string_view type_name);
std::string SimpleNameOf(std::string_view type_name);
// "com.x.Foo[][]" -> "com.x.Foo"
std::string StripArray(std::string_view type_name);
bool IsArrayType(std::string_view type_name);

} // namespace archlens
