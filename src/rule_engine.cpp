#include <archlens/rule_engine.h>

#include <archlens/errors.h>

#include <exception>
#include <utility>

namespace archlens {

RuleEngine::RuleEngine(std::vector<std::unique_ptr<Rule>> rules,
                       std::shared_ptr<Logger> logger)
    : rules_(std::move(rules)), logger_(EnsureLogger(std::move(logger))) {}

RuleEngine RuleEngine::FromConfig(const RuleConfig &config,
                                  const ComponentRegistry &registry,
                                  std::shared_ptr<Logger> logger) {
  std::vector<std::unique_ptr<Rule>> rules;
  std::vector<Diagnostic> diagnostics;
  for (const auto &name : config.order) {
    if (!registry.HasRule(name)) {
      diagnostics.push_back(Diagnostic{DiagnosticKind::kConfigurationError,
                                       name,
                                       "unknown rule '" + name + "', skipped"});
      continue;
    }
    rules.push_back(registry.CreateRule(name, config));
  }
  RuleEngine engine(std::move(rules), std::move(logger));
  engine.setup_diagnostics_ = std::move(diagnostics);
  return engine;
}

RuleEvaluation RuleEngine::Evaluate(const DependencyGraph &graph,
                                    const CouplingMetrics &metrics) const {
  RuleEvaluation evaluation;
  evaluation.diagnostics = setup_diagnostics_;

  for (const auto &rule : rules_) {
    const auto id = rule->Id();
    const auto errors = rule->ConfigurationErrors();
    if (!errors.empty()) {
      for (const auto &error : errors) {
        evaluation.diagnostics.push_back(
            Diagnostic{DiagnosticKind::kConfigurationError, id, error});
      }
      logger_->Log(LogLevel::kWarn, "rule.skipped",
                   {{"rule", id}, {"errors", std::to_string(errors.size())}});
      continue;
    }

    try {
      auto violations = rule->Evaluate(graph, metrics);
      logger_->Log(LogLevel::kDebug, "rule.complete",
                   {{"rule", id},
                    {"violations", std::to_string(violations.size())}});
      for (auto &violation : violations) {
        evaluation.violations.push_back(std::move(violation));
      }
    } catch (const InvariantViolation &) {
      throw;
    } catch (const std::exception &error) {
      evaluation.diagnostics.push_back(
          Diagnostic{DiagnosticKind::kRuleFailure, id, error.what()});
      logger_->Log(LogLevel::kError, "rule.failed",
                   {{"rule", id}, {"error", error.what()}});
    }
  }
  return evaluation;
}

} // namespace archlens
