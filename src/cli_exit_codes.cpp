#include <archlens/cli_exit_codes.h>

namespace archlens {
namespace {

bool Reaches(Severity severity, Severity fail_on) {
  return static_cast<int>(severity) >= static_cast<int>(fail_on);
}

} // namespace

int FindingsExitCode(const AnalysisResult &result, Severity fail_on) {
  for (const auto &violation : result.violations) {
    if (Reaches(violation.severity, fail_on)) {
      return kExitFindings;
    }
  }
  for (const auto *cycles : {&result.type_cycles, &result.package_cycles}) {
    for (const auto &cycle : *cycles) {
      if (Reaches(cycle.severity, fail_on)) {
        return kExitFindings;
      }
    }
  }
  return kExitClean;
}

} // namespace archlens
