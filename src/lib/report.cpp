#include <shx/report.hpp>

#include <utility>

namespace shx {

  report
  make_report(validation_results results) {
    report r;
    for (auto& result : results) {
      switch (result.severity) {
        case severity::violation:
          r.violations.push_back(std::move(result));
          break;
        case severity::warning:
          r.warnings.push_back(std::move(result));
          break;
        case severity::info:
          r.info.push_back(std::move(result));
          break;
      }
    }
    r.conforms = r.violations.empty();
    return r;
  }

} // namespace shx
