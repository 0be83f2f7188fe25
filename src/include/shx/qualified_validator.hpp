#pragma once

#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/validation_result.hpp>

namespace shx::qualified_validator {

  // Counts the values of the shape's path that are direct instances of
  // qualified_class. Fewer than qualified_min_count gives one result; the
  // check is off unless both fields are set.
  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape);

} // namespace shx::qualified_validator
