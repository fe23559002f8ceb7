#pragma once

#include <stdexcept>
#include <string>

namespace archlens {

// Broken precondition inside the analysis core. Always aborts the run.
class InvariantViolation : public std::logic_error {
public:
  explicit InvariantViolation(const std::string &message)
      : std::logic_error("invariant violation: " + message) {}
};

} // namespace archlens
