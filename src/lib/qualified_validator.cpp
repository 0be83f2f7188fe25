#include <shx/qualified_validator.hpp>

#include <shx/constraint_helpers.hpp>
#include <shx/vocabulary.hpp>

#include <algorithm>
#include <cstdint>

namespace shx::qualified_validator {

  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape) {
    if (!shape.qualified_class || !shape.qualified_min_count) return {};

    auto values = get_property_values(g, focus, shape.path);
    auto qualified = static_cast<std::size_t>(
        std::count_if(values.begin(), values.end(), [&](const term& v) {
          return is_instance_of(g, v, *shape.qualified_class);
        }));

    if (qualified >= *shape.qualified_min_count) return {};

    validation_results results;
    results.push_back(build_violation(
        focus, shape,
        "Property has too few values of required type (expected at least " +
            std::to_string(*shape.qualified_min_count) + " instances of " +
            to_string(*shape.qualified_class) + ", found " +
            std::to_string(qualified) + ")",
        {{"constraint_component", term{sh::qualified_min_count_component}},
         {"qualified_class", term{*shape.qualified_class}},
         {"qualified_min_count",
          static_cast<std::int64_t>(*shape.qualified_min_count)},
         {"actual_qualified_count", static_cast<std::int64_t>(qualified)},
         {"total_values", static_cast<std::int64_t>(values.size())}}));
    return results;
  }

} // namespace shx::qualified_validator
