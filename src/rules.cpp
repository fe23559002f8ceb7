#include <archlens/rules.h>

#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace archlens {
namespace {

std::string FormatInstability(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

std::string Join(const std::vector<std::string> &parts,
                 const std::string &separator) {
  std::string joined;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += parts[i];
  }
  return joined;
}

void RequirePositive(long long value, const std::string &key,
                     std::vector<std::string> &errors) {
  if (value <= 0) {
    errors.push_back(key + " must be positive, got " + std::to_string(value));
  }
}

// Folds every edge between the same ordered pair of nodes into one violation.
class PairViolations {
public:
  Violation &For(const Edge &edge) { return pairs_[{edge.source, edge.target}]; }

  std::vector<Violation> Take() {
    std::vector<Violation> violations;
    violations.reserve(pairs_.size());
    for (auto &entry : pairs_) {
      violations.push_back(std::move(entry.second));
    }
    return violations;
  }

private:
  std::map<std::pair<std::string, std::string>, Violation> pairs_;
};

} // namespace

bool MatchesPattern(const std::string &name, const std::string &pattern) {
  std::size_t n = 0;
  std::size_t p = 0;
  std::size_t star = std::string::npos;
  std::size_t resume = 0;
  while (n < name.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = n;
    } else if (p < pattern.size() && pattern[p] == name[n]) {
      ++p;
      ++n;
    } else if (star != std::string::npos) {
      p = star + 1;
      n = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

LayerAccessRule::LayerAccessRule(RuleConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> LayerAccessRule::ConfigurationErrors() const {
  std::vector<std::string> errors;
  std::set<std::string> names;
  std::map<std::string, std::string> pattern_owner;
  for (const auto &layer : config_.layers) {
    if (layer.name.empty()) {
      errors.push_back("layer without a name");
      continue;
    }
    if (!names.insert(layer.name).second) {
      errors.push_back("layer '" + layer.name + "' is declared twice");
    }
    for (const auto &pattern : layer.patterns) {
      const auto [owner, inserted] =
          pattern_owner.emplace(pattern, layer.name);
      if (!inserted && owner->second != layer.name) {
        errors.push_back("pattern '" + pattern + "' is assigned to both '" +
                         owner->second + "' and '" + layer.name + "'");
      }
    }
  }
  for (const auto &edge : config_.allowed_layer_edges) {
    for (const auto *name : {&edge.from, &edge.to}) {
      if (names.count(*name) == 0) {
        errors.push_back("allowed_layer_edges references unknown layer '" +
                         *name + "'");
      }
    }
  }
  return errors;
}

std::optional<std::string>
LayerAccessRule::LayerOf(const std::string &name) const {
  for (const auto &layer : config_.layers) {
    for (const auto &pattern : layer.patterns) {
      if (MatchesPattern(name, pattern)) {
        return layer.name;
      }
    }
  }
  return std::nullopt;
}

bool LayerAccessRule::IsAllowed(const std::string &from,
                                const std::string &to) const {
  if (from == to) {
    return true;
  }
  for (const auto &edge : config_.allowed_layer_edges) {
    if (edge.from == from && edge.to == to) {
      return true;
    }
  }
  return false;
}

std::vector<Violation>
LayerAccessRule::Evaluate(const DependencyGraph &graph,
                          const CouplingMetrics &) const {
  PairViolations pairs;
  for (const auto &edge : graph.Edges()) {
    const auto source_layer = LayerOf(edge.source);
    const auto target_layer = LayerOf(edge.target);
    if (!source_layer || !target_layer ||
        IsAllowed(*source_layer, *target_layer)) {
      continue;
    }
    auto &violation = pairs.For(edge);
    if (violation.rule_id.empty()) {
      violation.rule_id = Id();
      violation.severity = Severity::kHigh;
      violation.nodes = {edge.source, edge.target};
      violation.description = "Layer " + *source_layer + " may not access " +
                              *target_layer + ": " + edge.source + " -> " +
                              edge.target;
      violation.remediation =
          "Route the dependency through a layer " + *source_layer +
          " may access, or invert it behind an interface owned by " +
          *source_layer;
    }
    violation.edges.push_back(edge);
  }
  return pairs.Take();
}

GodObjectRule::GodObjectRule(RuleConfig config) : config_(std::move(config)) {}

std::vector<std::string> GodObjectRule::ConfigurationErrors() const {
  std::vector<std::string> errors;
  RequirePositive(config_.god_object_method_threshold,
                  "god_object_method_threshold", errors);
  RequirePositive(config_.god_object_field_threshold,
                  "god_object_field_threshold", errors);
  RequirePositive(config_.god_object_size_threshold,
                  "god_object_size_threshold", errors);
  return errors;
}

std::vector<Violation> GodObjectRule::Evaluate(const DependencyGraph &graph,
                                               const CouplingMetrics &) const {
  std::vector<Violation> violations;
  for (const auto &[name, node] : graph.Nodes()) {
    if (node.kind == NodeKind::kPackage) {
      continue;
    }
    std::vector<std::string> reasons;
    const auto exceeds = [&](std::size_t value, long long threshold,
                             const std::string &what) {
      if (static_cast<long long>(value) > threshold) {
        reasons.push_back(std::to_string(value) + " " + what +
                          " (threshold " + std::to_string(threshold) + ")");
      }
    };
    exceeds(node.method_count, config_.god_object_method_threshold, "methods");
    exceeds(node.field_count, config_.god_object_field_threshold, "fields");
    exceeds(node.estimated_size, config_.god_object_size_threshold,
            "estimated lines");
    if (reasons.empty()) {
      continue;
    }

    Violation violation;
    violation.rule_id = Id();
    violation.severity = Severity::kHigh;
    violation.nodes = {name};
    violation.description = name + " is a god object: " + Join(reasons, ", ");
    violation.remediation = "Split " + SimpleNameOf(name) +
                            " into smaller types with a single responsibility";
    violations.push_back(std::move(violation));
  }
  return violations;
}

GodPackageRule::GodPackageRule(RuleConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> GodPackageRule::ConfigurationErrors() const {
  std::vector<std::string> errors;
  RequirePositive(config_.god_package_type_threshold,
                  "god_package_type_threshold", errors);
  return errors;
}

std::vector<Violation> GodPackageRule::Evaluate(const DependencyGraph &graph,
                                                const CouplingMetrics &) const {
  std::map<std::string, std::size_t> type_counts;
  if (graph.granularity() == Granularity::kPackage) {
    for (const auto &[name, node] : graph.Nodes()) {
      type_counts[name] = node.contained_types;
    }
  } else {
    for (const auto &[package, members] : graph.NodesByPackage()) {
      type_counts[package] = members.size();
    }
  }

  std::vector<Violation> violations;
  for (const auto &[package, count] : type_counts) {
    if (static_cast<long long>(count) <= config_.god_package_type_threshold) {
      continue;
    }
    Violation violation;
    violation.rule_id = Id();
    violation.severity = Severity::kMedium;
    violation.nodes = {package};
    violation.description =
        "Package " + package + " contains " + std::to_string(count) +
        " types (threshold " +
        std::to_string(config_.god_package_type_threshold) + ")";
    violation.remediation =
        "Split " + package + " into cohesive sub-packages by feature";
    violations.push_back(std::move(violation));
  }
  return violations;
}

std::vector<Violation>
UnstableDependencyRule::Evaluate(const DependencyGraph &graph,
                                 const CouplingMetrics &metrics) const {
  PairViolations pairs;
  for (const auto &edge : graph.Edges()) {
    if (edge.target_external) {
      continue;
    }
    const auto source = metrics.find(edge.source);
    const auto target = metrics.find(edge.target);
    if (source == metrics.end() || target == metrics.end() ||
        target->second.instability <= source->second.instability) {
      continue;
    }
    auto &violation = pairs.For(edge);
    if (violation.rule_id.empty()) {
      violation.rule_id = Id();
      violation.severity = Severity::kMedium;
      violation.nodes = {edge.source, edge.target};
      violation.description =
          edge.source + " (I=" +
          FormatInstability(source->second.instability) +
          ") depends on less stable " + edge.target + " (I=" +
          FormatInstability(target->second.instability) + ")";
      violation.remediation = "Depend on an abstraction of " + edge.target +
                              " that is at least as stable as " + edge.source;
    }
    violation.edges.push_back(edge);
  }
  return pairs.Take();
}

LongParameterListRule::LongParameterListRule(RuleConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> LongParameterListRule::ConfigurationErrors() const {
  std::vector<std::string> errors;
  RequirePositive(config_.long_parameter_threshold, "long_parameter_threshold",
                  errors);
  return errors;
}

std::vector<Violation>
LongParameterListRule::Evaluate(const DependencyGraph &graph,
                                const CouplingMetrics &) const {
  std::vector<Violation> violations;
  for (const auto &[name, node] : graph.Nodes()) {
    for (const auto &method : node.methods) {
      if (static_cast<long long>(method.parameter_count) <=
          config_.long_parameter_threshold) {
        continue;
      }
      Violation violation;
      violation.rule_id = Id();
      violation.severity = Severity::kMedium;
      violation.nodes = {name};
      violation.description =
          name + "#" + method.name + " takes " +
          std::to_string(method.parameter_count) + " parameters (threshold " +
          std::to_string(config_.long_parameter_threshold) + ")";
      violation.remediation =
          "Introduce a parameter object for " + method.name;
      violations.push_back(std::move(violation));
    }
  }
  return violations;
}

} // namespace archlens
