#pragma once

#include <archlens/models.h>
#include <archlens/symbol_table.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace archlens {

struct LayerDefinition {
  std::string name;
  // Glob patterns over fully qualified type names, '*' matches any run.
  std::vector<std::string> patterns;
};

struct LayerEdge {
  std::string from;
  std::string to;
};

std::vector<std::string> DefaultRuleOrder();

struct RuleConfig {
  std::vector<std::string> order = DefaultRuleOrder();
  std::vector<LayerDefinition> layers;
  std::vector<LayerEdge> allowed_layer_edges;
  long long god_object_method_threshold = 50;
  long long god_object_field_threshold = 30;
  long long god_object_size_threshold = 500;
  long long god_package_type_threshold = 50;
  long long long_parameter_threshold = 6;
};

struct AnalysisConfig {
  Vocabulary vocabulary = DefaultVocabulary();
  StrengthThresholds strength;
  RuleConfig rules;
  // Extraction workers, 0 selects the hardware concurrency.
  std::size_t jobs = 0;
  // Contradictory settings that were replaced by their defaults.
  std::vector<Diagnostic> diagnostics;
};

const std::vector<std::string> &SupportedRuleConfigKeys();

AnalysisConfig ParseAnalysisConfig(const std::string &yaml_text);
AnalysisConfig LoadAnalysisConfig(const std::filesystem::path &path);

} // namespace archlens
