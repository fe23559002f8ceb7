#include <archlens/analysis_config.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

namespace archlens {
namespace {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(std::move(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"rule_order", "rules"},
      {"allowed_edges", "allowed_layer_edges"},
      {"god_object_member_threshold", "god_object_method_threshold"}};
  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown rule config key: " + key +
                        ". Supported keys: ";
  const auto &supported = SupportedRuleConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string ExtractString(const YAML::Node &node, const std::string &key) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Rule config key '" + key +
                                "' must be a string");
  }
  return node.as<std::string>();
}

std::vector<std::string> ExtractStringList(const YAML::Node &node,
                                           const std::string &key) {
  std::vector<std::string> values;
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
    return values;
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument("Rule config key '" + key +
                                "' must be a string or list of strings");
  }
  for (const auto &child : node) {
    values.push_back(ExtractString(child, key));
  }
  return values;
}

long long ExtractInteger(const YAML::Node &node, const std::string &key) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Rule config key '" + key +
                                "' must be an integer");
  }
  try {
    return node.as<long long>();
  } catch (const YAML::BadConversion &) {
    throw std::invalid_argument("Rule config key '" + key +
                                "' must be an integer, got '" +
                                node.as<std::string>() + "'");
  }
}

std::vector<LayerDefinition> ExtractLayers(const YAML::Node &node) {
  std::vector<LayerDefinition> layers;
  if (node.IsMap()) {
    for (const auto &entry : node) {
      layers.push_back(LayerDefinition{entry.first.as<std::string>(),
                                       ExtractStringList(entry.second,
                                                         "layers")});
    }
    return layers;
  }
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsMap() || !child["name"]) {
        throw std::invalid_argument(
            "Each entry of 'layers' must be a mapping with a 'name'");
      }
      LayerDefinition layer;
      layer.name = ExtractString(child["name"], "layers.name");
      if (child["patterns"]) {
        layer.patterns = ExtractStringList(child["patterns"], "layers.patterns");
      }
      layers.push_back(std::move(layer));
    }
    return layers;
  }
  throw std::invalid_argument(
      "Rule config key 'layers' must map layer names to pattern lists");
}

LayerEdge ParseArrowEdge(const std::string &text) {
  const auto arrow = text.find("->");
  if (arrow == std::string::npos) {
    throw std::invalid_argument("Allowed layer edge '" + text +
                                "' must look like 'from -> to'");
  }
  const auto trim = [](std::string value) {
    const auto first = value.find_first_not_of(" \t");
    const auto last = value.find_last_not_of(" \t");
    return first == std::string::npos ? std::string{}
                                      : value.substr(first, last - first + 1);
  };
  return LayerEdge{trim(text.substr(0, arrow)), trim(text.substr(arrow + 2))};
}

std::vector<LayerEdge> ExtractLayerEdges(const YAML::Node &node) {
  if (!node.IsSequence()) {
    throw std::invalid_argument(
        "Rule config key 'allowed_layer_edges' must be a list");
  }
  std::vector<LayerEdge> edges;
  for (const auto &child : node) {
    if (child.IsSequence() && child.size() == 2) {
      edges.push_back(
          LayerEdge{ExtractString(child[0], "allowed_layer_edges"),
                    ExtractString(child[1], "allowed_layer_edges")});
    } else if (child.IsMap() && child["from"] && child["to"]) {
      edges.push_back(LayerEdge{ExtractString(child["from"], "from"),
                                ExtractString(child["to"], "to")});
    } else if (child.IsScalar()) {
      edges.push_back(ParseArrowEdge(child.as<std::string>()));
    } else {
      throw std::invalid_argument(
          "Allowed layer edges must be [from, to] pairs, {from, to} maps or "
          "'from -> to' strings");
    }
  }
  return edges;
}

void ApplyKey(const std::string &key, const YAML::Node &value,
              AnalysisConfig &config) {
  if (key == "layers") {
    config.rules.layers = ExtractLayers(value);
  } else if (key == "allowed_layer_edges") {
    config.rules.allowed_layer_edges = ExtractLayerEdges(value);
  } else if (key == "rules") {
    config.rules.order = ExtractStringList(value, key);
  } else if (key == "god_object_method_threshold") {
    config.rules.god_object_method_threshold = ExtractInteger(value, key);
  } else if (key == "god_object_field_threshold") {
    config.rules.god_object_field_threshold = ExtractInteger(value, key);
  } else if (key == "god_object_size_threshold") {
    config.rules.god_object_size_threshold = ExtractInteger(value, key);
  } else if (key == "god_package_type_threshold") {
    config.rules.god_package_type_threshold = ExtractInteger(value, key);
  } else if (key == "long_parameter_threshold") {
    config.rules.long_parameter_threshold = ExtractInteger(value, key);
  } else if (key == "strong_edge_occurrence_threshold") {
    config.strength.strong = static_cast<double>(ExtractInteger(value, key));
  } else if (key == "moderate_edge_occurrence_threshold") {
    config.strength.moderate = static_cast<double>(ExtractInteger(value, key));
  } else if (key == "platform_root") {
    config.vocabulary.platform_root = ExtractString(value, key);
  } else if (key == "platform_namespaces") {
    config.vocabulary.platform_namespaces = ExtractStringList(value, key);
  } else if (key == "value_types") {
    config.vocabulary.value_types = ExtractStringList(value, key);
  } else if (key == "container_types") {
    config.vocabulary.container_types = ExtractStringList(value, key);
  } else if (key == "injection_markers") {
    config.vocabulary.injection_markers = ExtractStringList(value, key);
  } else {
    ThrowUnknownKey(key);
  }
}

AnalysisConfig ParseRoot(const YAML::Node &root) {
  AnalysisConfig config;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Rule config must contain a mapping at the root");
  }
  for (const auto &entry : root) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto &supported = SupportedRuleConfigKeys();
    if (std::find(supported.begin(), supported.end(), key) ==
        supported.end()) {
      ThrowUnknownKey(entry.first.as<std::string>());
    }
    ApplyKey(key, entry.second, config);
  }
  if (config.strength.moderate > config.strength.strong) {
    std::ostringstream message;
    message << "moderate_edge_occurrence_threshold ("
            << config.strength.moderate
            << ") exceeds strong_edge_occurrence_threshold ("
            << config.strength.strong << "), using defaults";
    config.diagnostics.push_back(Diagnostic{
        DiagnosticKind::kConfigurationError, "strength", message.str()});
    config.strength = StrengthThresholds{};
  }
  return config;
}

} // namespace

std::vector<std::string> DefaultRuleOrder() {
  return {"layer-access", "god-object", "god-package", "unstable-dependency",
          "long-parameter-list"};
}

const std::vector<std::string> &SupportedRuleConfigKeys() {
  static const std::vector<std::string> keys = {
      "layers",
      "allowed_layer_edges",
      "rules",
      "god_object_method_threshold",
      "god_object_field_threshold",
      "god_object_size_threshold",
      "god_package_type_threshold",
      "long_parameter_threshold",
      "strong_edge_occurrence_threshold",
      "moderate_edge_occurrence_threshold",
      "platform_root",
      "platform_namespaces",
      "value_types",
      "container_types",
      "injection_markers"};
  return keys;
}

AnalysisConfig ParseAnalysisConfig(const std::string &yaml_text) {
  try {
    return ParseRoot(YAML::Load(yaml_text));
  } catch (const YAML::ParserException &error) {
    throw std::invalid_argument(std::string("Malformed rule config: ") +
                                error.what());
  }
}

AnalysisConfig LoadAnalysisConfig(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Rule config file not found: " + path.string());
  }
  try {
    return ParseRoot(YAML::LoadFile(path.string()));
  } catch (const YAML::ParserException &error) {
    throw std::invalid_argument("Malformed rule config " + path.string() +
                                ": " + error.what());
  }
}

} // namespace archlens
