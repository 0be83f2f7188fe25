#pragma once

#include <shx/graph.hpp>
#include <shx/sparql_model.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shx::sparql {

  // Variable bindings of one solution, keyed by variable name without the
  // leading '?'.
  using solution = std::map<std::string, term>;

  struct result_set {
    // Projected variables in SELECT order.
    std::vector<std::string> variables;
    std::vector<solution> rows;
  };

  struct query_options {
    // Wall-clock budget for one execution; unlimited when unset.
    std::optional<std::chrono::milliseconds> timeout;
  };

  // Evaluates `query` over `g`. Throws query_timeout when the budget in
  // `opts` runs out.
  result_set
  execute(const graph& g, const select_query& query,
          const query_options& opts = {});

  // Parses and evaluates a SELECT query. Throws query_error.
  result_set
  select(const graph& g, const std::string& query,
         const query_options& opts = {});

} // namespace shx::sparql
