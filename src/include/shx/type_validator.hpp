#pragma once

#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/validation_result.hpp>

namespace shx::type_validator {

  // sh:datatype and sh:class on every value of the shape's path. Each value
  // is checked against both, so one value may produce two results.
  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape);

  // sh:datatype, sh:class and sh:nodeKind on the focus node itself.
  validation_results
  validate_node(const graph& g, const term& focus, const node_shape& shape);

} // namespace shx::type_validator
