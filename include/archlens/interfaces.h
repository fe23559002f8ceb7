#pragma once

#include <archlens/analysis_config.h>
#include <archlens/graph.h>
#include <archlens/models.h>
#include <archlens/symbol_table.h>

#include <filesystem>
#include <string>
#include <vector>

namespace archlens {

struct ExtractionResult {
  TypeNode node;
  std::vector<Edge> edges;
  std::vector<Diagnostic> diagnostics;
};

struct AnalysisResult {
  DependencyGraph type_graph{Granularity::kType};
  DependencyGraph package_graph{Granularity::kPackage};
  CouplingMetrics type_metrics;
  CouplingMetrics package_metrics;
  std::vector<Cycle> type_cycles;
  std::vector<Cycle> package_cycles;
  std::vector<Violation> violations;
  std::vector<Diagnostic> diagnostics;
  GraphSummary summary;
  std::map<std::string, std::size_t> inheritance_depths;
};

class MetadataLoader {
public:
  virtual ~MetadataLoader() = default;
  virtual std::vector<TypeMetadata> Load(const std::filesystem::path &path) = 0;
};

// Implementations must be safe to call concurrently on distinct types.
class RelationshipExtractor {
public:
  virtual ~RelationshipExtractor() = default;
  virtual ExtractionResult Extract(const TypeMetadata &type,
                                   const SymbolTable &symbols) const = 0;
};

class Rule {
public:
  virtual ~Rule() = default;
  virtual std::string Id() const = 0;
  // Problems that make the rule unusable with its configuration.
  virtual std::vector<std::string> ConfigurationErrors() const { return {}; }
  virtual std::vector<Violation> Evaluate(const DependencyGraph &graph,
                                          const CouplingMetrics &metrics) const = 0;
};

class AnalyzerPipeline {
public:
  virtual ~AnalyzerPipeline() = default;
  virtual AnalysisResult Run(const std::vector<TypeMetadata> &types,
                             const AnalysisConfig &config) = 0;
};

} // namespace archlens
