#include <shx/cardinality_validator.hpp>

#include <shx/constraint_helpers.hpp>
#include <shx/vocabulary.hpp>

#include <cstdint>

namespace shx::cardinality_validator {

  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape) {
    validation_results results;
    if (!shape.min_count && !shape.max_count) return results;

    auto count = get_property_values(g, focus, shape.path).size();

    if (shape.min_count && count < *shape.min_count) {
      results.push_back(build_violation(
          focus, shape,
          "Property has too few values (expected at least " +
              std::to_string(*shape.min_count) + ", found " +
              std::to_string(count) + ")",
          {{"constraint_component", term{sh::min_count_component}},
           {"min_count", static_cast<std::int64_t>(*shape.min_count)},
           {"actual_count", static_cast<std::int64_t>(count)}}));
    }

    if (shape.max_count && count > *shape.max_count) {
      results.push_back(build_violation(
          focus, shape,
          "Property has too many values (expected at most " +
              std::to_string(*shape.max_count) + ", found " +
              std::to_string(count) + ")",
          {{"constraint_component", term{sh::max_count_component}},
           {"max_count", static_cast<std::int64_t>(*shape.max_count)},
           {"actual_count", static_cast<std::int64_t>(count)}}));
    }

    return results;
  }

} // namespace shx::cardinality_validator
