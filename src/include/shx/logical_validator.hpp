#pragma once

#include <shx/diagnostics.hpp>
#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/validation_result.hpp>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace shx {

  // Node shapes by id. Holds pointers into the vector it was built from.
  using shape_map = std::unordered_map<term, const node_shape*>;

  shape_map
  make_shape_map(const std::vector<node_shape>& shapes);

} // namespace shx

namespace shx::logical_validator {

  inline constexpr std::size_t max_recursion_depth = 50;

  // sh:and, sh:or, sh:xone and sh:not. A referenced shape conforms when the
  // focus node produces no results against its node-level constraints, its
  // property shapes and its own logical operators. An unknown reference is
  // reported through `on_warning` and treated as conforming; so is a chain
  // of references deeper than max_recursion_depth.
  validation_results
  validate_node(const graph& g, const term& focus, const node_shape& shape,
                const shape_map& shapes, const warning_fn& on_warning = {},
                std::size_t depth = 0);

} // namespace shx::logical_validator
