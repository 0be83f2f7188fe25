#pragma once

#include <shx/graph.hpp>
#include <shx/shape.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shx {

  class shape_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Builds node shapes from a shapes graph. Every subject typed sh:NodeShape
  // becomes one node_shape, in order of first appearance; one that is also an
  // rdfs:Class gets an implicit class target. Shapes named by sh:and, sh:or,
  // sh:xone or sh:not follow. Malformed shapes throw shape_error.
  class shape_reader {
  public:
    explicit shape_reader(const graph& shapes) : g_(shapes) {}

    std::vector<node_shape>
    read() const;

    node_shape
    read_node_shape(const term& id) const;

    property_shape
    read_property_shape(const term& id) const;

  private:
    const graph& g_;

    sparql_constraint
    read_sparql_constraint(const term& shape_id, const term& id) const;

    std::vector<term>
    read_list(const term& owner, const term& head) const;

    std::optional<std::string>
    read_string(const term& subject, const iri& predicate) const;

    std::optional<iri>
    read_iri(const term& subject, const iri& predicate) const;

    std::optional<std::size_t>
    read_count(const term& subject, const iri& predicate) const;

    std::optional<pattern_constraint>
    read_pattern(const term& subject) const;
  };

  std::vector<node_shape>
  read_shapes(const graph& shapes);

} // namespace shx
