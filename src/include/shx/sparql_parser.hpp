#pragma once

#include <shx/sparql_model.hpp>

#include <string>

namespace shx::sparql {

  // Parses the SELECT form of SPARQL 1.1: prologue, projection, WHERE group
  // graph pattern and solution modifiers. Syntax errors throw query_error.
  class query_parser {
  public:
    select_query
    parse(const std::string& source);
  };

} // namespace shx::sparql
