#pragma once

#include <shx/graph.hpp>
#include <shx/shape.hpp>
#include <shx/validation_result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shx {

  // Objects of every (focus, path, ?) triple.
  std::vector<term>
  get_property_values(const graph& g, const term& focus, const iri& path);

  // Direct rdf:type assertion only; no subclass reasoning.
  bool
  is_instance_of(const graph& g, const term& node, const iri& class_);

  bool
  is_datatype(const term& t, const iri& datatype);

  bool
  is_node_kind(const term& t, node_kind kind);

  // Lexical form of a literal; nullopt for IRIs and blank nodes.
  std::optional<std::string>
  extract_string(const term& t);

  // Numeric value of a literal with a numeric XSD datatype whose lexical form
  // parses; nullopt otherwise.
  std::optional<double>
  extract_number(const term& t);

  // Length in characters (code points) of a literal's lexical form.
  std::optional<std::size_t>
  extract_length(const term& t);

  bool
  is_numeric_datatype(const iri& datatype);

  // A violation of `shape` at `focus`. The shape's own message replaces
  // `default_message` when set; source shape and constraint component are
  // taken from the "source_shape" and "constraint_component" details when
  // present, otherwise the source shape is the shape's id.
  validation_result
  build_violation(const term& focus, const property_shape& shape,
                  std::string default_message, result_details details,
                  std::optional<term> value = std::nullopt);

  validation_result
  build_node_violation(const term& focus, const node_shape& shape,
                       std::string default_message, result_details details,
                       std::optional<term> value = std::nullopt);

} // namespace shx
