#pragma once

#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/validation_result.hpp>

namespace shx::value_validator {

  // sh:in and the numeric range constraints per value, and sh:hasValue over
  // the whole value set (at most one result). Non-numeric values are skipped
  // by the range checks.
  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape);

  // sh:in, sh:hasValue and the four range constraints on the focus node.
  validation_results
  validate_node(const graph& g, const term& focus, const node_shape& shape);

} // namespace shx::value_validator
