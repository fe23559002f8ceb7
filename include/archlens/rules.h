#pragma once

#include <archlens/analysis_config.h>
#include <archlens/interfaces.h>

#include <optional>
#include <string>
#include <vector>

namespace archlens {

inline constexpr const char kLayerAccessRule[] = "layer-access";
inline constexpr const char kGodObjectRule[] = "god-object";
inline constexpr const char kGodPackageRule[] = "god-package";
inline constexpr const char kUnstableDependencyRule[] = "unstable-dependency";
inline constexpr const char kLongParameterListRule[] = "long-parameter-list";

bool MatchesPattern(const std::string &name, const std::string &pattern);

class LayerAccessRule : public Rule {
public:
  explicit LayerAccessRule(RuleConfig config);

  std::string Id() const override { return kLayerAccessRule; }
  std::vector<std::string> ConfigurationErrors() const override;
  std::vector<Violation> Evaluate(const DependencyGraph &graph,
                                  const CouplingMetrics &metrics) const override;

  // First layer, in configuration order, with a pattern matching name.
  std::optional<std::string> LayerOf(const std::string &name) const;

private:
  bool IsAllowed(const std::string &from, const std::string &to) const;

  RuleConfig config_;
};

class GodObjectRule : public Rule {
public:
  explicit GodObjectRule(RuleConfig config);

  std::string Id() const override { return kGodObjectRule; }
  std::vector<std::string> ConfigurationErrors() const override;
  std::vector<Violation> Evaluate(const DependencyGraph &graph,
                                  const CouplingMetrics &metrics) const override;

private:
  RuleConfig config_;
};

class GodPackageRule : public Rule {
public:
  explicit GodPackageRule(RuleConfig config);

  std::string Id() const override { return kGodPackageRule; }
  std::vector<std::string> ConfigurationErrors() const override;
  std::vector<Violation> Evaluate(const DependencyGraph &graph,
                                  const CouplingMetrics &metrics) const override;

private:
  RuleConfig config_;
};

// Stable dependencies principle: depend in the direction of stability.
class UnstableDependencyRule : public Rule {
public:
  std::string Id() const override { return kUnstableDependencyRule; }
  std::vector<Violation> Evaluate(const DependencyGraph &graph,
                                  const CouplingMetrics &metrics) const override;
};

class LongParameterListRule : public Rule {
public:
  explicit LongParameterListRule(RuleConfig config);

  std::string Id() const override { return kLongParameterListRule; }
  std::vector<std::string> ConfigurationErrors() const override;
  std::vector<Violation> Evaluate(const DependencyGraph &graph,
                                  const CouplingMetrics &metrics) const override;

private:
  RuleConfig config_;
};

} // namespace archlens
