#pragma once

#include <archlens/analyzer_pipeline_builder.h>

#include <memory>

namespace archlens {

// Parallel extraction, single-threaded assembly, then metrics, cycle
// detection and rules concurrently over the assembled graphs.
class DefaultAnalyzerPipeline : public AnalyzerPipeline {
public:
  explicit DefaultAnalyzerPipeline(PipelineComponents components);

  AnalysisResult Run(const std::vector<TypeMetadata> &types,
                     const AnalysisConfig &config) override;

private:
  ExtractionResult ExtractOne(const TypeMetadata &type,
                              const SymbolTable &symbols) const;

  std::unique_ptr<RelationshipExtractor> extractor_;
  std::shared_ptr<Logger> logger_;
  const ComponentRegistry *registry_;
};

} // namespace archlens
