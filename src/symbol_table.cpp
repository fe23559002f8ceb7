#include <archlens/symbol_table.h>

#include <utility>

namespace archlens {
namespace {

constexpr const char kDefaultPackage[] = "(default)";

bool HasPrefix(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool InNamespace(std::string_view name, std::string_view ns) {
  if (ns.empty()) {
    return false;
  }
  if (name == ns) {
    return true;
  }
  return name.size() > ns.size() && HasPrefix(name, ns) &&
         name[ns.size()] == '.';
}

bool MatchesWildcardEntry(std::string_view name, std::string_view entry) {
  if (entry.size() > 2 && entry.substr(entry.size() - 2) == ".*") {
    return InNamespace(name, entry.substr(0, entry.size() - 2));
  }
  return false;
}

} // namespace

Vocabulary DefaultVocabulary() {
  Vocabulary vocabulary;
  vocabulary.platform_namespaces = {"java",  "javax", "jakarta", "jdk",
                                    "sun",   "com.sun", "kotlin", "scala"};
  vocabulary.value_types = {"java.lang.String",     "java.lang.Boolean",
                            "java.lang.Byte",       "java.lang.Character",
                            "java.lang.Short",      "java.lang.Integer",
                            "java.lang.Long",       "java.lang.Float",
                            "java.lang.Double",     "java.lang.Number",
                            "java.lang.Object",     "java.lang.Class",
                            "java.lang.Enum",       "java.util.UUID",
                            "java.util.Optional",   "java.util.Date",
                            "java.math.*",          "java.time.*"};
  vocabulary.container_types = {
      "java.util.Collection", "java.util.List",     "java.util.ArrayList",
      "java.util.LinkedList", "java.util.Set",      "java.util.HashSet",
      "java.util.LinkedHashSet", "java.util.TreeSet", "java.util.SortedSet",
      "java.util.Queue",      "java.util.Deque",    "java.util.ArrayDeque",
      "java.util.Map",        "java.util.HashMap",  "java.util.LinkedHashMap",
      "java.util.TreeMap",    "java.util.SortedMap",
      "java.util.concurrent.ConcurrentHashMap",
      "java.util.concurrent.CopyOnWriteArrayList", "java.lang.Iterable",
      "java.util.stream.Stream"};
  vocabulary.injection_markers = {
      "org.springframework.beans.factory.annotation.Autowired",
      "javax.inject.Inject", "jakarta.inject.Inject",
      "javax.annotation.Resource", "jakarta.annotation.Resource",
      "com.google.inject.Inject"};
  return vocabulary;
}

SymbolTable::SymbolTable(const std::vector<TypeMetadata> &types,
                         Vocabulary vocabulary)
    : vocabulary_(std::move(vocabulary)) {
  for (const auto &type : types) {
    entries_.emplace(type.name, SymbolEntry{PackageOf(type.name), type.kind});
  }
  value_types_.insert(vocabulary_.value_types.begin(),
                      vocabulary_.value_types.end());
  container_types_.insert(vocabulary_.container_types.begin(),
                          vocabulary_.container_types.end());
  for (const auto &marker : vocabulary_.injection_markers) {
    injection_markers_.insert(marker);
    marker_simple_names_.insert(SimpleNameOf(marker));
  }
}

bool SymbolTable::IsKnown(const std::string &name) const {
  return entries_.count(name) != 0;
}

const SymbolEntry *SymbolTable::Find(const std::string &name) const {
  const auto found = entries_.find(name);
  return found == entries_.end() ? nullptr : &found->second;
}

bool SymbolTable::IsPlatform(std::string_view name) const {
  for (const auto &ns : vocabulary_.platform_namespaces) {
    if (InNamespace(name, ns)) {
      return true;
    }
  }
  return false;
}

bool SymbolTable::IsPlatformRoot(std::string_view name) const {
  return name == vocabulary_.platform_root;
}

bool SymbolTable::IsPrimitive(std::string_view name) const {
  return name == "boolean" || name == "byte" || name == "char" ||
         name == "short" || name == "int" || name == "long" ||
         name == "float" || name == "double" || name == "void";
}

bool SymbolTable::IsValueType(std::string_view name) const {
  if (value_types_.count(std::string(name)) != 0) {
    return true;
  }
  for (const auto &entry : vocabulary_.value_types) {
    if (MatchesWildcardEntry(name, entry)) {
      return true;
    }
  }
  return false;
}

bool SymbolTable::IsContainer(std::string_view name) const {
  return container_types_.count(std::string(name)) != 0;
}

bool SymbolTable::IsInjectionMarker(std::string_view annotation) const {
  if (annotation.find('.') == std::string_view::npos) {
    return marker_simple_names_.count(std::string(annotation)) != 0;
  }
  return injection_markers_.count(std::string(annotation)) != 0 ||
         injection_markers_.count(SimpleNameOf(annotation)) != 0;
}

std::string PackageOf(std::string_view type_name) {
  const auto element = StripArray(type_name);
  const auto dot = element.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    return kDefaultPackage;
  }
  return element.substr(0, dot);
}

std::string SimpleNameOf(std::string_view type_name) {
  const auto dot = type_name.rfind('.');
  if (dot == std::string_view::npos) {
    return std::string(type_name);
  }
  return std::string(type_name.substr(dot + 1));
}

std::string StripArray(std::string_view type_name) {
  while (type_name.size() >= 2 &&
         type_name.substr(type_name.size() - 2) == "[]") {
    type_name.remove_suffix(2);
  }
  return std::string(type_name);
}

bool IsArrayType(std::string_view type_name) {
  return type_name.size() >= 2 &&
         type_name.substr(type_name.size() - 2) == "[]";
}

} // namespace archlens
