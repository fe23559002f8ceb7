#include <archlens/analyzer_pipeline_builder.h>

#include <archlens/default_analyzer_pipeline.h>

#include <utility>

namespace archlens {

AnalyzerPipelineBuilder::AnalyzerPipelineBuilder(
    const ComponentRegistry &registry)
    : registry_(&registry),
      extractor_name_(registry.DefaultExtractorName()) {}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithExtractor(
    std::unique_ptr<RelationshipExtractor> extractor) {
  components_.extractor = std::move(extractor);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithExtractorName(std::string name) {
  extractor_name_ = std::move(name);
  return *this;
}

DefaultAnalyzerPipeline AnalyzerPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.extractor = components_.extractor
                              ? std::move(components_.extractor)
                              : registry_->CreateExtractor(extractor_name_);
  components_.registry = registry_;
  return DefaultAnalyzerPipeline(std::move(components_));
}

} // namespace archlens
