#pragma once

#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/validation_result.hpp>

namespace shx::cardinality_validator {

  // sh:minCount and sh:maxCount on the number of values of the shape's path.
  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape);

} // namespace shx::cardinality_validator
