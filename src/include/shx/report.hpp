#pragma once

#include <shx/validation_result.hpp>

#include <cstddef>

namespace shx {

  // Outcome of a validation run, with results bucketed by severity.
  struct report {
    bool conforms = true;
    validation_results violations;
    validation_results warnings;
    validation_results info;

    std::size_t
    issue_count() const {
      return violations.size() + warnings.size() + info.size();
    }

    bool
    has_violations() const {
      return !violations.empty();
    }

    bool
    operator==(const report&) const = default;
  };

  // Partitions `results` by severity, keeping their order. The report
  // conforms when no result has violation severity.
  report
  make_report(validation_results results);

} // namespace shx
