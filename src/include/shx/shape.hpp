#pragma once

#include <shx/term.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace re2 {
  class RE2;
}

namespace shx {

  enum class severity {
    violation,
    warning,
    info,
  };

  iri
  severity_iri(severity s);

  // sh:Violation, sh:Warning, sh:Info; any other IRI maps to violation.
  severity
  severity_from_iri(const iri& i);

  enum class node_kind {
    iri,
    blank_node,
    literal,
    blank_node_or_iri,
    blank_node_or_literal,
    iri_or_literal,
  };

  iri
  node_kind_iri(node_kind k);

  std::optional<node_kind>
  node_kind_from_iri(const iri& i);

  // A regular expression together with the source text and flags it was
  // compiled from. Recognized flags: "i" (case-insensitive), "s" (dot matches
  // newline), "m" (multi-line anchors) and "q" (literal pattern). Matching
  // runs in time linear in the input; copies share the compiled program.
  class pattern_constraint {
    std::string source_;
    std::string flags_;
    std::shared_ptr<const re2::RE2> regex_;

  public:
    explicit pattern_constraint(std::string source, std::string flags = "");

    const std::string&
    source() const {
      return source_;
    }

    const std::string&
    flags() const {
      return flags_;
    }

    // True when the pattern matches anywhere in `text`.
    bool
    matches(const std::string& text) const;

    bool
    operator==(const pattern_constraint& other) const {
      return source_ == other.source_ && flags_ == other.flags_;
    }
  };

  struct property_shape {
    term id;
    iri path;
    std::string message;
    shx::severity severity = shx::severity::violation;

    std::optional<std::size_t> min_count;
    std::optional<std::size_t> max_count;

    std::optional<iri> datatype;
    std::optional<iri> class_;

    std::optional<pattern_constraint> pattern;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;

    std::vector<term> in;
    std::optional<term> has_value;

    std::optional<term> min_inclusive;
    std::optional<term> max_inclusive;
    std::optional<term> min_exclusive;
    std::optional<term> max_exclusive;

    std::optional<iri> qualified_class;
    std::optional<std::size_t> qualified_min_count;
  };

  struct sparql_constraint {
    term source_shape;
    std::string message;
    std::string select_query;
    // prefix -> namespace, declared ahead of the query text.
    std::map<std::string, std::string> prefixes;
  };

  struct node_shape {
    term id;

    std::vector<iri> target_classes;
    std::vector<term> target_nodes;
    std::vector<iri> target_subjects_of;
    std::vector<iri> target_objects_of;
    // Set for a shape that is also an rdfs:Class: its instances are targets.
    bool implicit_class_target = false;

    std::vector<property_shape> property_shapes;
    std::vector<sparql_constraint> sparql_constraints;

    std::string message;
    shx::severity severity = shx::severity::violation;

    std::optional<iri> datatype;
    std::optional<iri> class_;
    std::optional<shx::node_kind> node_kind;
    std::optional<pattern_constraint> pattern;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::vector<std::string> language_in;
    std::vector<term> in;
    std::optional<term> has_value;

    // Bounds are literals; one that is not numeric disables its check.
    std::optional<term> min_inclusive;
    std::optional<term> max_inclusive;
    std::optional<term> min_exclusive;
    std::optional<term> max_exclusive;

    // Logical operators refer to other node shapes by id.
    std::vector<term> and_;
    std::vector<term> or_;
    std::vector<term> xone;
    std::optional<term> not_;
  };

} // namespace shx
