#pragma once

#include <shx/diagnostics.hpp>
#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/sparql_engine.hpp>
#include <shx/validation_result.hpp>

#include <string>
#include <vector>

namespace shx::sparql_validator {

  // Rewrites the `$this` placeholder in `query` for `focus`.
  //
  // For an IRI, "SELECT $this" becomes "SELECT ?this", every other `$this`
  // becomes <iri>, and when ?this is projected a BIND of the IRI to ?this is
  // inserted after the first "WHERE {". A blank node is written as _:id and a
  // literal in its N-Triples form; neither gets the projection rewrite, so
  // such queries cannot project $this.
  //
  // The rewrite is textual: `$this` inside a comment or string literal is
  // replaced as well.
  std::string
  substitute_this(const std::string& query, const term& focus);

  // Runs each constraint's query for `focus`; every result row becomes one
  // result. A query that fails to parse, fails to run or exceeds
  // `opts.timeout` contributes nothing and is reported through `on_warning`.
  validation_results
  validate(const graph& g, const term& focus,
           const std::vector<sparql_constraint>& constraints,
           const sparql::query_options& opts = {},
           const warning_fn& on_warning = {});

} // namespace shx::sparql_validator
