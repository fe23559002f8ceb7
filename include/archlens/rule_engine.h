#pragma once

#include <archlens/component_registry.h>
#include <archlens/interfaces.h>
#include <archlens/logging.h>

#include <memory>
#include <vector>

namespace archlens {

struct RuleEvaluation {
  std::vector<Violation> violations;
  std::vector<Diagnostic> diagnostics;
};

// Runs rules in order. A rule with configuration errors is skipped and a rule
// that throws is reported; the remaining rules still run.
class RuleEngine {
public:
  RuleEngine(std::vector<std::unique_ptr<Rule>> rules,
             std::shared_ptr<Logger> logger = nullptr);

  static RuleEngine FromConfig(const RuleConfig &config,
                               const ComponentRegistry &registry,
                               std::shared_ptr<Logger> logger = nullptr);

  RuleEvaluation Evaluate(const DependencyGraph &graph,
                          const CouplingMetrics &metrics) const;

  std::size_t RuleCount() const { return rules_.size(); }

private:
  std::vector<std::unique_ptr<Rule>> rules_;
  std::vector<Diagnostic> setup_diagnostics_;
  std::shared_ptr<Logger> logger_;
};

} // namespace archlens
