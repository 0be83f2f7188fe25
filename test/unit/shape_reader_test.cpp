#include <shx/shape_reader.hpp>
#include <shx/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace shx;

namespace {

  iri
  ex(const std::string& local) {
    return iri("http://example.org/" + local);
  }

  // Adds an RDF list of `items` and returns its head.
  term
  add_list(graph& g, const std::string& name, const std::vector<term>& items) {
    term head{rdf::nil};
    for (std::size_t i = items.size(); i-- > 0;) {
      term cell{blank_node(name + std::to_string(i))};
      g.add(cell, rdf::first, items[i]);
      g.add(cell, rdf::rest, head);
      head = cell;
    }
    return head;
  }

  literal
  count(std::int64_t n) {
    return literal::integer(n);
  }

} // namespace

// -- Node shapes --------------------------------------------------------------

TEST_CASE("shape reader: targets and severity", "[shape_reader]") {
  graph g;
  auto s = ex("PersonShape");
  g.add(s, rdf::type, sh::node_shape);
  g.add(s, sh::target_class, ex("Person"));
  g.add(s, sh::target_node, ex("alice"));
  g.add(s, sh::target_subjects_of, ex("knows"));
  g.add(s, sh::target_objects_of, ex("knows"));
  g.add(s, sh::severity, sh::warning);
  g.add(s, sh::message, literal("Not a person"));

  auto shapes = read_shapes(g);
  REQUIRE(shapes.size() == 1);
  const auto& shape = shapes[0];
  CHECK(shape.id == term{s});
  CHECK(shape.target_classes == std::vector<iri>{ex("Person")});
  CHECK(shape.target_nodes == std::vector<term>{ex("alice")});
  CHECK(shape.target_subjects_of == std::vector<iri>{ex("knows")});
  CHECK(shape.target_objects_of == std::vector<iri>{ex("knows")});
  CHECK(shape.severity == severity::warning);
  CHECK(shape.message == "Not a person");
  CHECK_FALSE(shape.implicit_class_target);
}

TEST_CASE("shape reader: shape that is also a class", "[shape_reader]") {
  graph g;
  auto s = ex("Person");
  g.add(s, rdf::type, sh::node_shape);
  g.add(s, rdf::type, rdfs::class_);

  auto shapes = read_shapes(g);
  REQUIRE(shapes.size() == 1);
  CHECK(shapes[0].implicit_class_target);
}

TEST_CASE("shape reader: node-level constraints", "[shape_reader]") {
  graph g;
  auto s = ex("S");
  g.add(s, rdf::type, sh::node_shape);
  g.add(s, sh::node_kind, sh::iri_kind);
  g.add(s, sh::datatype, xsd::string);
  g.add(s, sh::pattern, literal("^a"));
  g.add(s, sh::flags, literal("i"));
  g.add(s, sh::min_length, count(2));
  g.add(s, sh::max_inclusive, literal::integer(10));
  g.add(s, sh::has_value, ex("v"));
  g.add(s, sh::language_in,
        add_list(g, "l", {literal("en"), literal("fr")}));
  g.add(s, sh::in, add_list(g, "i", {ex("a"), literal::integer(1)}));

  auto shape = shape_reader(g).read_node_shape(s);
  CHECK(shape.node_kind == node_kind::iri);
  CHECK(shape.datatype == xsd::string);
  REQUIRE(shape.pattern);
  CHECK(shape.pattern->source() == "^a");
  CHECK(shape.pattern->flags() == "i");
  CHECK(shape.min_length == 2u);
  CHECK(shape.max_inclusive == term{literal::integer(10)});
  CHECK(shape.has_value == term{ex("v")});
  CHECK(shape.language_in == std::vector<std::string>{"en", "fr"});
  REQUIRE(shape.in.size() == 2);
  CHECK(shape.in[1] == term{literal::integer(1)});
}

// -- Property shapes ----------------------------------------------------------

TEST_CASE("shape reader: property shape", "[shape_reader]") {
  graph g;
  auto s = ex("S");
  term p{blank_node("p")};
  g.add(s, rdf::type, sh::node_shape);
  g.add(s, sh::property, p);
  g.add(p, sh::path, ex("age"));
  g.add(p, sh::min_count, count(1));
  g.add(p, sh::max_count, count(1));
  g.add(p, sh::datatype, xsd::integer);
  g.add(p, sh::min_inclusive, literal::integer(0));
  g.add(p, sh::max_exclusive, literal("150.5", xsd::decimal));
  g.add(p, sh::severity, sh::info);

  auto shapes = read_shapes(g);
  REQUIRE(shapes.size() == 1);
  REQUIRE(shapes[0].property_shapes.size() == 1);
  const auto& prop = shapes[0].property_shapes[0];
  CHECK(prop.id == p);
  CHECK(prop.path == ex("age"));
  CHECK(prop.min_count == 1u);
  CHECK(prop.max_count == 1u);
  CHECK(prop.datatype == xsd::integer);
  CHECK(prop.min_inclusive == term{literal::integer(0)});
  CHECK(prop.max_exclusive == term{literal("150.5", xsd::decimal)});
  CHECK(prop.severity == severity::info);
}

TEST_CASE("shape reader: property bounds are kept as written",
          "[shape_reader]") {
  graph g;
  term p{blank_node("p")};
  g.add(p, sh::path, ex("age"));
  g.add(p, sh::max_inclusive, literal("lots"));

  auto prop = shape_reader(g).read_property_shape(p);
  CHECK(prop.max_inclusive == term{literal("lots")});
  CHECK_FALSE(prop.min_inclusive);
}

TEST_CASE("shape reader: qualified value shape", "[shape_reader]") {
  graph g;
  term p{blank_node("p")};
  term q{blank_node("q")};
  g.add(p, sh::path, ex("knows"));
  g.add(p, sh::qualified_value_shape, q);
  g.add(q, sh::class_, ex("Person"));
  g.add(p, sh::qualified_min_count, count(2));

  auto prop = shape_reader(g).read_property_shape(p);
  CHECK(prop.qualified_class == ex("Person"));
  CHECK(prop.qualified_min_count == 2u);
}

// -- Logical operators and SPARQL constraints ---------------------------------

TEST_CASE("shape reader: referenced shapes are read too", "[shape_reader]") {
  graph g;
  auto s = ex("S");
  term a{blank_node("a")};
  term b{blank_node("b")};
  g.add(s, rdf::type, sh::node_shape);
  g.add(s, sh::or_, add_list(g, "or", {a, b}));
  g.add(a, sh::datatype, xsd::string);
  g.add(b, sh::not_, ex("T"));
  g.add(ex("T"), rdf::type, sh::node_shape);

  auto shapes = read_shapes(g);
  REQUIRE(shapes.size() == 4);
  CHECK(shapes[0].id == term{s});
  CHECK(shapes[0].or_ == std::vector<term>{a, b});
  CHECK(shapes[1].id == term{ex("T")});
  CHECK(shapes[2].id == a);
  CHECK(shapes[2].datatype == xsd::string);
  CHECK(shapes[3].id == b);
  CHECK(shapes[3].not_ == term{ex("T")});
}

TEST_CASE("shape reader: SPARQL constraint with prefixes", "[shape_reader]") {
  graph g;
  auto s = ex("S");
  term c{blank_node("c")};
  term decl{blank_node("d")};
  g.add(s, rdf::type, sh::node_shape);
  g.add(s, sh::sparql, c);
  g.add(c, sh::select, literal("SELECT $this WHERE { $this ex:p ?v }"));
  g.add(c, sh::message, literal("bad"));
  g.add(c, sh::prefixes, ex("ontology"));
  g.add(ex("ontology"), sh::declare, decl);
  g.add(decl, sh::prefix, literal("ex"));
  g.add(decl, sh::namespace_, literal("http://example.org/", xsd::any_uri));

  auto shapes = read_shapes(g);
  REQUIRE(shapes[0].sparql_constraints.size() == 1);
  const auto& constraint = shapes[0].sparql_constraints[0];
  CHECK(constraint.source_shape == term{s});
  CHECK(constraint.message == "bad");
  CHECK(constraint.select_query == "SELECT $this WHERE { $this ex:p ?v }");
  REQUIRE(constraint.prefixes.size() == 1);
  CHECK(constraint.prefixes.at("ex") == "http://example.org/");
}

// -- Errors -------------------------------------------------------------------

TEST_CASE("shape reader: malformed shapes throw", "[shape_reader]") {
  graph g;
  auto s = ex("S");
  g.add(s, rdf::type, sh::node_shape);

  SECTION("missing path") {
    g.add(s, sh::property, blank_node("p"));
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }

  SECTION("literal path") {
    g.add(s, sh::property, blank_node("p"));
    g.add(blank_node("p"), sh::path, literal("age"));
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }

  SECTION("negative count") {
    g.add(s, sh::min_length, literal::integer(-1));
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }

  SECTION("unknown node kind") {
    g.add(s, sh::node_kind, ex("Kind"));
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }

  SECTION("invalid pattern") {
    g.add(s, sh::pattern, literal("(["));
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }

  SECTION("SPARQL constraint without a query") {
    g.add(s, sh::sparql, blank_node("c"));
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }

  SECTION("cyclic list") {
    term cell{blank_node("cell")};
    g.add(cell, rdf::first, literal::integer(1));
    g.add(cell, rdf::rest, cell);
    g.add(s, sh::in, cell);
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }

  SECTION("list without rdf:rest") {
    term cell{blank_node("cell")};
    g.add(cell, rdf::first, literal::integer(1));
    g.add(s, sh::in, cell);
    CHECK_THROWS_AS(read_shapes(g), shape_error);
  }
}
