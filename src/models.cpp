#include <archlens/models.h>

#include <sstream>

namespace archlens {

std::string EdgeKindName(EdgeKind kind) {
  switch (kind) {
  case EdgeKind::kInheritance:
    return "inheritance";
  case EdgeKind::kComposition:
    return "composition";
  case EdgeKind::kAggregation:
    return "aggregation";
  case EdgeKind::kAssociation:
    return "association";
  case EdgeKind::kUsage:
    return "usage";
  }
  return "unknown";
}

std::string UsageKindName(UsageKind kind) {
  switch (kind) {
  case UsageKind::kNone:
    return "none";
  case UsageKind::kCall:
    return "call";
  case UsageKind::kInstantiate:
    return "instantiate";
  case UsageKind::kTypeCheck:
    return "type_check";
  }
  return "unknown";
}

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kLow:
    return "LOW";
  case Severity::kMedium:
    return "MEDIUM";
  case Severity::kHigh:
    return "HIGH";
  }
  return "UNKNOWN";
}

std::string DiagnosticKindName(DiagnosticKind kind) {
  switch (kind) {
  case DiagnosticKind::kPartialExtraction:
    return "partial_extraction";
  case DiagnosticKind::kUnresolvedTarget:
    return "unresolved_target";
  case DiagnosticKind::kConfigurationError:
    return "configuration_error";
  case DiagnosticKind::kRuleFailure:
    return "rule_failure";
  case DiagnosticKind::kDuplicateType:
    return "duplicate_type";
  }
  return "unknown";
}

bool IsAbstractType(const TypeNode &node) {
  return node.kind == NodeKind::kInterface || node.modifiers.is_abstract;
}

std::string DescribeEdge(const Edge &edge) {
  std::ostringstream stream;
  stream << edge.source << " -> " << edge.target << " ["
         << EdgeKindName(edge.kind);
  if (edge.kind == EdgeKind::kUsage) {
    stream << ":" << UsageKindName(edge.usage);
  }
  if (edge.kind == EdgeKind::kInheritance && edge.is_interface) {
    stream << ":interface";
  }
  if (!edge.member.empty()) {
    stream << " via " << edge.member;
  }
  stream << " x" << edge.occurrence_count << "]";
  if (edge.target_external) {
    stream << " (external)";
  }
  return stream.str();
}

} // namespace archlens
