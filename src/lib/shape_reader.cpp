#include <shx/shape_reader.hpp>

#include <shx/constraint_helpers.hpp>
#include <shx/vocabulary.hpp>

#include <charconv>
#include <set>

namespace shx {

  namespace {

    [[noreturn]] void
    error(const term& shape, const std::string& msg) {
      throw shape_error("shape_reader: " + to_string(shape) + ": " + msg);
    }

    void
    append_iris(const graph& g, const term& subject, const iri& predicate,
                std::vector<iri>& out) {
      for (const auto& o : g.objects(subject, predicate)) {
        if (const auto* i = std::get_if<iri>(&o)) out.push_back(*i);
      }
    }

  } // namespace

  std::vector<node_shape>
  shape_reader::read() const {
    std::vector<node_shape> shapes;
    std::set<term> seen;
    for (const auto& id : g_.subjects(rdf::type, term{sh::node_shape})) {
      if (seen.insert(id).second) shapes.push_back(read_node_shape(id));
    }

    // Shapes reached only through logical operators, typically untyped
    // blank nodes, are read as well. They have no targets of their own.
    for (std::size_t i = 0; i < shapes.size(); ++i) {
      std::vector<term> refs;
      const auto& s = shapes[i];
      for (const auto* list : {&s.and_, &s.or_, &s.xone}) {
        refs.insert(refs.end(), list->begin(), list->end());
      }
      if (s.not_) refs.push_back(*s.not_);
      for (const auto& ref : refs) {
        if (seen.insert(ref).second) shapes.push_back(read_node_shape(ref));
      }
    }
    return shapes;
  }

  node_shape
  shape_reader::read_node_shape(const term& id) const {
    node_shape s;
    s.id = id;

    append_iris(g_, id, sh::target_class, s.target_classes);
    s.target_nodes = g_.objects(id, sh::target_node);
    append_iris(g_, id, sh::target_subjects_of, s.target_subjects_of);
    append_iris(g_, id, sh::target_objects_of, s.target_objects_of);
    s.implicit_class_target = is_instance_of(g_, id, rdfs::class_);

    for (const auto& p : g_.objects(id, sh::property)) {
      s.property_shapes.push_back(read_property_shape(p));
    }
    for (const auto& c : g_.objects(id, sh::sparql)) {
      s.sparql_constraints.push_back(read_sparql_constraint(id, c));
    }

    s.message = read_string(id, sh::message).value_or("");
    if (auto sev = read_iri(id, sh::severity)) {
      s.severity = severity_from_iri(*sev);
    }

    s.datatype = read_iri(id, sh::datatype);
    s.class_ = read_iri(id, sh::class_);
    if (auto kind = g_.object(id, sh::node_kind)) {
      const auto* kind_iri = std::get_if<iri>(&*kind);
      if (!kind_iri) error(id, "sh:nodeKind must be an IRI");
      s.node_kind = node_kind_from_iri(*kind_iri);
      if (!s.node_kind) error(id, "unknown node kind " + to_string(*kind));
    }
    s.pattern = read_pattern(id);
    s.min_length = read_count(id, sh::min_length);
    s.max_length = read_count(id, sh::max_length);

    if (auto head = g_.object(id, sh::language_in)) {
      for (const auto& tag : read_list(id, *head)) {
        auto text = extract_string(tag);
        if (!text) error(id, "sh:languageIn members must be literals");
        s.language_in.push_back(*text);
      }
    }
    if (auto head = g_.object(id, sh::in)) s.in = read_list(id, *head);
    s.has_value = g_.object(id, sh::has_value);

    s.min_inclusive = g_.object(id, sh::min_inclusive);
    s.max_inclusive = g_.object(id, sh::max_inclusive);
    s.min_exclusive = g_.object(id, sh::min_exclusive);
    s.max_exclusive = g_.object(id, sh::max_exclusive);

    if (auto head = g_.object(id, sh::and_)) s.and_ = read_list(id, *head);
    if (auto head = g_.object(id, sh::or_)) s.or_ = read_list(id, *head);
    if (auto head = g_.object(id, sh::xone)) s.xone = read_list(id, *head);
    s.not_ = g_.object(id, sh::not_);

    return s;
  }

  property_shape
  shape_reader::read_property_shape(const term& id) const {
    property_shape p;
    p.id = id;

    auto path = g_.object(id, sh::path);
    if (!path) error(id, "missing sh:path");
    const auto* path_iri = std::get_if<iri>(&*path);
    if (!path_iri) error(id, "sh:path must be an IRI, got " + to_string(*path));
    p.path = *path_iri;

    p.message = read_string(id, sh::message).value_or("");
    if (auto sev = read_iri(id, sh::severity)) {
      p.severity = severity_from_iri(*sev);
    }

    p.min_count = read_count(id, sh::min_count);
    p.max_count = read_count(id, sh::max_count);
    p.datatype = read_iri(id, sh::datatype);
    p.class_ = read_iri(id, sh::class_);
    p.pattern = read_pattern(id);
    p.min_length = read_count(id, sh::min_length);
    p.max_length = read_count(id, sh::max_length);
    if (auto head = g_.object(id, sh::in)) p.in = read_list(id, *head);
    p.has_value = g_.object(id, sh::has_value);

    p.min_inclusive = g_.object(id, sh::min_inclusive);
    p.max_inclusive = g_.object(id, sh::max_inclusive);
    p.min_exclusive = g_.object(id, sh::min_exclusive);
    p.max_exclusive = g_.object(id, sh::max_exclusive);

    // Only the sh:class of the qualified value shape is honoured.
    if (auto qualified = g_.object(id, sh::qualified_value_shape)) {
      p.qualified_class = read_iri(*qualified, sh::class_);
      p.qualified_min_count = read_count(id, sh::qualified_min_count);
    }

    return p;
  }

  sparql_constraint
  shape_reader::read_sparql_constraint(const term& shape_id,
                                       const term& id) const {
    sparql_constraint c;
    c.source_shape = shape_id;
    c.message = read_string(id, sh::message).value_or("");

    auto select = read_string(id, sh::select);
    if (!select) error(shape_id, "sh:sparql constraint without sh:select");
    c.select_query = *select;

    for (const auto& owner : g_.objects(id, sh::prefixes)) {
      for (const auto& decl : g_.objects(owner, sh::declare)) {
        auto prefix = read_string(decl, sh::prefix);
        auto ns = read_string(decl, sh::namespace_);
        if (!prefix || !ns) {
          error(shape_id, "sh:declare needs sh:prefix and sh:namespace");
        }
        c.prefixes[*prefix] = *ns;
      }
    }
    return c;
  }

  std::vector<term>
  shape_reader::read_list(const term& owner, const term& head) const {
    std::vector<term> items;
    std::set<term> visited;
    term node = head;
    while (node != term{rdf::nil}) {
      if (!visited.insert(node).second) error(owner, "cyclic RDF list");
      auto first = g_.object(node, rdf::first);
      auto rest = g_.object(node, rdf::rest);
      if (!first || !rest) {
        error(owner, "malformed RDF list at " + to_string(node) +
                         ": missing rdf:first or rdf:rest");
      }
      items.push_back(std::move(*first));
      node = std::move(*rest);
    }
    return items;
  }

  std::optional<std::string>
  shape_reader::read_string(const term& subject, const iri& predicate) const {
    auto value = g_.object(subject, predicate);
    if (!value) return std::nullopt;
    return extract_string(*value);
  }

  std::optional<iri>
  shape_reader::read_iri(const term& subject, const iri& predicate) const {
    auto value = g_.object(subject, predicate);
    if (!value || !is_iri(*value)) return std::nullopt;
    return std::get<iri>(*value);
  }

  std::optional<std::size_t>
  shape_reader::read_count(const term& subject, const iri& predicate) const {
    auto value = g_.object(subject, predicate);
    if (!value) return std::nullopt;

    auto text = extract_string(*value);
    std::size_t n = 0;
    if (text) {
      auto [end, ec] = std::from_chars(text->data(),
                                       text->data() + text->size(), n);
      if (ec == std::errc{} && end == text->data() + text->size()) return n;
    }
    error(subject, to_string(term{predicate}) +
                       " must be a non-negative integer, got " +
                       to_string(*value));
  }

  std::optional<pattern_constraint>
  shape_reader::read_pattern(const term& subject) const {
    auto source = read_string(subject, sh::pattern);
    if (!source) return std::nullopt;
    try {
      return pattern_constraint(*source,
                                read_string(subject, sh::flags).value_or(""));
    } catch (const std::invalid_argument& e) {
      error(subject, e.what());
    }
  }

  std::vector<node_shape>
  read_shapes(const graph& shapes) {
    return shape_reader(shapes).read();
  }

} // namespace shx
