#pragma once

#include <archlens/interfaces.h>

namespace archlens {

inline constexpr int kExitClean = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitFindings = 2;

// kExitFindings when any violation or cycle reaches fail_on.
int FindingsExitCode(const AnalysisResult &result,
                     Severity fail_on = Severity::kHigh);

} // namespace archlens
