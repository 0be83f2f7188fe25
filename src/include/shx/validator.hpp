#pragma once

#include <shx/diagnostics.hpp>
#include <shx/graph.hpp>
#include <shx/logical_validator.hpp>
#include <shx/report.hpp>
#include <shx/shape.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace shx {

  struct validation_options {
    // Validate node shapes concurrently, one task per shape. Results keep
    // shape order either way.
    bool parallel = false;
    // Tasks in flight at once; 0 means std::thread::hardware_concurrency().
    std::size_t max_concurrency = 0;
    // Budget for each query constraint execution.
    std::optional<std::chrono::milliseconds> query_timeout;
    warning_fn on_warning;
  };

  // Focus nodes of `shape` in `data`: instances of its target classes (and
  // of the shape itself when it is an implicit class target), its target
  // nodes, subjects of its targetSubjectsOf predicates and objects of its
  // targetObjectsOf predicates. Duplicates are dropped, first occurrence
  // kept.
  std::vector<term>
  select_targets(const graph& data, const node_shape& shape);

  // All results of `shape` over its focus nodes. `shapes` resolves the
  // shapes named by logical operators.
  validation_results
  validate_shape(const graph& data, const node_shape& shape,
                 const shape_map& shapes, const validation_options& opts = {});

  report
  validate(const graph& data, const std::vector<node_shape>& shapes,
           const validation_options& opts = {});

  // Reads the shapes from `shapes_graph` first; throws shape_error when they
  // are malformed.
  report
  validate(const graph& data, const graph& shapes_graph,
           const validation_options& opts = {});

} // namespace shx
