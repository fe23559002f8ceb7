#include <archlens/default_analyzer_pipeline.h>

#include <archlens/coupling_metrics.h>
#include <archlens/cycle_detector.h>
#include <archlens/errors.h>
#include <archlens/relationship_extractor.h>
#include <archlens/rule_engine.h>
#include <archlens/worker_pool.h>

#include <chrono>
#include <exception>
#include <future>
#include <unordered_set>
#include <utility>

namespace archlens {

DefaultAnalyzerPipeline::DefaultAnalyzerPipeline(PipelineComponents components)
    : extractor_(std::move(components.extractor)),
      logger_(EnsureLogger(std::move(components.logger))),
      registry_(components.registry != nullptr ? components.registry
                                               : &GlobalComponentRegistry()) {
  if (!extractor_) {
    extractor_ = registry_->CreateExtractor();
  }
}

ExtractionResult
DefaultAnalyzerPipeline::ExtractOne(const TypeMetadata &type,
                                    const SymbolTable &symbols) const {
  try {
    return extractor_->Extract(type, symbols);
  } catch (const InvariantViolation &) {
    throw;
  } catch (const std::exception &error) {
    ExtractionResult result;
    result.node = MakeTypeNode(type);
    result.node.partial = true;
    result.diagnostics.push_back(
        Diagnostic{DiagnosticKind::kPartialExtraction, type.name,
                   std::string("extraction failed: ") + error.what()});
    return result;
  }
}

AnalysisResult DefaultAnalyzerPipeline::Run(const std::vector<TypeMetadata> &types,
                                            const AnalysisConfig &config) {
  const auto pipeline_start = std::chrono::steady_clock::now();
  WorkerPool pool(config.jobs);
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"types", std::to_string(types.size())},
                {"jobs", std::to_string(pool.size())}});

  AnalysisResult result;
  result.diagnostics = config.diagnostics;
  for (const auto &diagnostic : config.diagnostics) {
    logger_->Log(LogLevel::kWarn, "config.recovered",
                 {{"subject", diagnostic.subject},
                  {"message", diagnostic.message}});
  }
  std::vector<const TypeMetadata *> unique_types;
  std::unordered_set<std::string> seen;
  for (const auto &type : types) {
    if (!seen.insert(type.name).second) {
      result.diagnostics.push_back(
          Diagnostic{DiagnosticKind::kDuplicateType, type.name,
                     "type declared more than once, later copy ignored"});
      continue;
    }
    unique_types.push_back(&type);
  }

  const SymbolTable symbols(types, config.vocabulary);
  auto extractions =
      ParallelMap(pool, unique_types, [&](const TypeMetadata *type) {
        return ExtractOne(*type, symbols);
      });

  std::vector<TypeNode> nodes;
  std::vector<Edge> edges;
  nodes.reserve(extractions.size());
  for (auto &extraction : extractions) {
    if (extraction.node.partial) {
      logger_->Log(LogLevel::kWarn, "extract.partial",
                   {{"type", extraction.node.name}});
    }
    nodes.push_back(std::move(extraction.node));
    edges.insert(edges.end(), std::make_move_iterator(extraction.edges.begin()),
                 std::make_move_iterator(extraction.edges.end()));
    result.diagnostics.insert(
        result.diagnostics.end(),
        std::make_move_iterator(extraction.diagnostics.begin()),
        std::make_move_iterator(extraction.diagnostics.end()));
  }
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "extract"},
                {"nodes", std::to_string(nodes.size())},
                {"edges", std::to_string(edges.size())}});

  result.type_graph = AssembleGraph(std::move(nodes), edges);
  result.type_graph.ValidateInvariants();
  result.package_graph = ProjectToPackages(result.type_graph, symbols);
  result.package_graph.ValidateInvariants();
  logger_->Log(
      LogLevel::kDebug, "pipeline.stage.complete",
      {{"stage", "assemble"},
       {"type_edges", std::to_string(result.type_graph.Edges().size())},
       {"packages", std::to_string(result.package_graph.Nodes().size())},
       {"package_edges",
        std::to_string(result.package_graph.Edges().size())}});

  const auto engine =
      RuleEngine::FromConfig(config.rules, *registry_, logger_);
  const CycleDetector detector(config.strength);
  const auto &type_graph = result.type_graph;
  const auto &package_graph = result.package_graph;

  std::shared_future<CouplingMetrics> type_metrics =
      std::async(std::launch::async,
                 [&type_graph]() { return ComputeCoupling(type_graph); })
          .share();
  auto package_metrics = std::async(std::launch::async, [&package_graph]() {
    return ComputeCoupling(package_graph);
  });
  auto type_cycles = std::async(std::launch::async, [&]() {
    return detector.FindCycles(type_graph);
  });
  auto package_cycles = std::async(std::launch::async, [&]() {
    return detector.FindCycles(package_graph);
  });
  auto rules = std::async(std::launch::async,
                          [&engine, &type_graph, metrics = type_metrics]() {
                            return engine.Evaluate(type_graph, metrics.get());
                          });

  result.summary = SummarizeGraph(type_graph);
  result.inheritance_depths = InheritanceDepths(type_graph);
  result.type_metrics = type_metrics.get();
  result.package_metrics = package_metrics.get();
  result.type_cycles = type_cycles.get();
  result.package_cycles = package_cycles.get();
  auto evaluation = rules.get();
  result.violations = std::move(evaluation.violations);
  result.diagnostics.insert(
      result.diagnostics.end(),
      std::make_move_iterator(evaluation.diagnostics.begin()),
      std::make_move_iterator(evaluation.diagnostics.end()));
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "analyze"},
                {"type_cycles", std::to_string(result.type_cycles.size())},
                {"package_cycles",
                 std::to_string(result.package_cycles.size())},
                {"violations", std::to_string(result.violations.size())}});

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"violations", std::to_string(result.violations.size())},
                {"diagnostics", std::to_string(result.diagnostics.size())}});
  return result;
}

} // namespace archlens
