#pragma once

#include <archlens/component_registry.h>
#include <archlens/interfaces.h>
#include <archlens/logging.h>

#include <memory>
#include <string>

namespace archlens {

class DefaultAnalyzerPipeline;

struct PipelineComponents {
  std::unique_ptr<RelationshipExtractor> extractor;
  std::shared_ptr<Logger> logger;
  const ComponentRegistry *registry = nullptr;
};

class AnalyzerPipelineBuilder {
public:
  explicit AnalyzerPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  AnalyzerPipelineBuilder &
  WithExtractor(std::unique_ptr<RelationshipExtractor> extractor);
  AnalyzerPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalyzerPipelineBuilder &WithExtractorName(std::string name);

  DefaultAnalyzerPipeline Build();

private:
  const ComponentRegistry *registry_;
  std::string extractor_name_;
  PipelineComponents components_;
};

} // namespace archlens
