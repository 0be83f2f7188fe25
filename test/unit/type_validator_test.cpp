#include <shx/type_validator.hpp>
#include <shx/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace shx;

namespace {

  const iri alice{"http://example.org/alice"};
  const iri bob{"http://example.org/bob"};
  const iri age{"http://example.org/age"};
  const iri knows{"http://example.org/knows"};
  const iri person{"http://example.org/Person"};

} // namespace

TEST_CASE("type_validator: datatype mismatch per value", "[type]") {
  graph g;
  g.add(alice, age, literal::integer(30));
  g.add(alice, age, literal("thirty"));

  property_shape p;
  p.id = blank_node("p");
  p.path = age;
  p.datatype = xsd::integer;

  auto results = type_validator::validate(g, alice, p);
  REQUIRE(results.size() == 1);
  CHECK(results[0].value == term{literal("thirty")});
  CHECK(results[0].message == "Value does not have required datatype <" +
                                  xsd::ns + "integer>");
  CHECK(results[0].constraint_component == sh::datatype_component);
  CHECK(std::get<term>(results[0].details.at("expected_datatype")) ==
        term{xsd::integer});
}

TEST_CASE("type_validator: language-tagged strings are not xsd:string",
          "[type]") {
  graph g;
  g.add(alice, age, literal::lang_string("trente", "fr"));

  property_shape p;
  p.path = age;
  p.datatype = xsd::string;

  CHECK(type_validator::validate(g, alice, p).size() == 1);
}

TEST_CASE("type_validator: class requires a direct rdf:type", "[type]") {
  graph g;
  g.add(alice, knows, bob);
  g.add(alice, knows, literal("carol"));
  g.add(bob, rdf::type, person);

  property_shape p;
  p.path = knows;
  p.class_ = person;

  auto results = type_validator::validate(g, alice, p);
  REQUIRE(results.size() == 1);
  CHECK(results[0].value == term{literal("carol")});
  CHECK(results[0].constraint_component == sh::class_component);
  CHECK(results[0].message ==
        "Value is not an instance of class <http://example.org/Person>");
}

TEST_CASE("type_validator: one value can fail datatype and class", "[type]") {
  graph g;
  g.add(alice, knows, literal("carol"));

  property_shape p;
  p.path = knows;
  p.datatype = xsd::integer;
  p.class_ = person;

  CHECK(type_validator::validate(g, alice, p).size() == 2);
}

TEST_CASE("type_validator: node kind of the focus node", "[type]") {
  graph g;
  node_shape s;
  s.id = iri("http://example.org/S");
  s.node_kind = node_kind::iri;

  CHECK(type_validator::validate_node(g, alice, s).empty());

  auto results = type_validator::validate_node(g, blank_node("b"), s);
  REQUIRE(results.size() == 1);
  CHECK(results[0].message == "Focus node does not match required node kind <" +
                                  sh::ns + "IRI>");
  CHECK(results[0].constraint_component == sh::node_kind_component);
  CHECK_FALSE(results[0].result_path);
  CHECK(results[0].source_shape == s.id);
}

TEST_CASE("type_validator: datatype and class of the focus node", "[type]") {
  graph g;
  g.add(alice, rdf::type, person);

  node_shape s;
  s.class_ = person;
  CHECK(type_validator::validate_node(g, alice, s).empty());
  CHECK(type_validator::validate_node(g, bob, s).size() == 1);

  node_shape d;
  d.datatype = xsd::integer;
  CHECK(type_validator::validate_node(g, literal::integer(1), d).empty());
  CHECK(type_validator::validate_node(g, alice, d).size() == 1);
}
