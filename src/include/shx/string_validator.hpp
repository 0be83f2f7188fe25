#pragma once

#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/validation_result.hpp>

namespace shx::string_validator {

  // sh:pattern, sh:minLength and sh:maxLength on the values of the shape's
  // path. Values that are not literals are skipped.
  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape);

  // sh:pattern, sh:minLength, sh:maxLength and sh:languageIn on the focus
  // node.
  validation_results
  validate_node(const graph& g, const term& focus, const node_shape& shape);

} // namespace shx::string_validator
