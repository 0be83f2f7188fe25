#include <shx/sparql_validator.hpp>
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

  sparql_constraint
  constraint(std::string query, std::string message = "Query violation") {
    sparql_constraint c;
    c.source_shape = ex("EventShape");
    c.message = std::move(message);
    c.select_query = std::move(query);
    c.prefixes["ex"] = "http://example.org/";
    return c;
  }

  graph
  events() {
    graph g;
    g.add(ex("e1"), ex("startLine"), literal::integer(10));
    g.add(ex("e1"), ex("endLine"), literal::integer(5));
    g.add(ex("e2"), ex("startLine"), literal::integer(1));
    g.add(ex("e2"), ex("endLine"), literal::integer(4));
    return g;
  }

  const std::string end_before_start =
      "SELECT $this ?value WHERE { $this ex:startLine ?start ; "
      "ex:endLine ?value . FILTER (?value < ?start) }";

} // namespace

// -- $this substitution -------------------------------------------------------

TEST_CASE("sparql validator: IRI focus is spelled and projected",
          "[sparql_validator]") {
  auto q = sparql_validator::substitute_this(
      "SELECT $this WHERE { $this ex:p ?o }", ex("a"));
  CHECK(q == "SELECT ?this WHERE { BIND(<http://example.org/a> AS ?this) .  "
             "<http://example.org/a> ex:p ?o }");
}

TEST_CASE("sparql validator: IRI focus without projection",
          "[sparql_validator]") {
  auto q = sparql_validator::substitute_this(
      "SELECT ?o WHERE {\n  $this ex:p ?o }", ex("a"));
  CHECK(q == "SELECT ?o WHERE {\n  <http://example.org/a> ex:p ?o }");
}

TEST_CASE("sparql validator: blank node and literal focus",
          "[sparql_validator]") {
  CHECK(sparql_validator::substitute_this("SELECT ?o WHERE { $this ?p ?o }",
                                          blank_node("b7")) ==
        "SELECT ?o WHERE { _:b7 ?p ?o }");
  CHECK(sparql_validator::substitute_this("ASK { ?s ?p $this }",
                                          literal::integer(3)) ==
        "ASK { ?s ?p \"3\"^^<http://www.w3.org/2001/XMLSchema#integer> }");
}

// -- Validation ---------------------------------------------------------------

TEST_CASE("sparql validator: one result per row", "[sparql_validator]") {
  auto g = events();
  auto results = sparql_validator::validate(g, ex("e1"),
                                            {constraint(end_before_start)});
  REQUIRE(results.size() == 1);
  const auto& r = results[0];
  CHECK(r.focus_node == term{ex("e1")});
  CHECK(r.message == "Query violation");
  CHECK(r.source_shape == term{ex("EventShape")});
  CHECK(r.constraint_component == sh::sparql_component);
  CHECK(r.value == term{literal::integer(5)});
  CHECK(std::get<term>(r.details.at("this")) == term{ex("e1")});
  CHECK_FALSE(r.result_path);

  CHECK(sparql_validator::validate(g, ex("e2"), {constraint(end_before_start)})
            .empty());
}

TEST_CASE("sparql validator: ?path becomes the result path",
          "[sparql_validator]") {
  auto g = events();
  auto results = sparql_validator::validate(
      g, ex("e1"),
      {constraint("SELECT ?path WHERE { $this ?path ?v FILTER (?v > 8) }")});
  REQUIRE(results.size() == 1);
  CHECK(results[0].result_path == ex("startLine"));
}

TEST_CASE("sparql validator: blank node focus", "[sparql_validator]") {
  graph g;
  g.add(blank_node("n"), ex("flag"), literal::boolean(true));
  auto results = sparql_validator::validate(
      g, blank_node("n"),
      {constraint("SELECT ?f WHERE { $this ex:flag ?f FILTER (?f) }")});
  CHECK(results.size() == 1);
}

TEST_CASE("sparql validator: failing queries are skipped with a warning",
          "[sparql_validator]") {
  auto g = events();
  std::vector<std::string> warnings;
  auto sink = [&](const std::string& msg) { warnings.push_back(msg); };

  auto broken = constraint("SELECT ?x WHERE { $this undefined:p ?x }");
  auto results = sparql_validator::validate(
      g, ex("e1"), {broken, constraint(end_before_start)}, {}, sink);

  CHECK(results.size() == 1);
  REQUIRE(warnings.size() == 1);
  CHECK(warnings[0].find("SPARQL query execution failed for "
                         "<http://example.org/EventShape>: ") == 0);
}

TEST_CASE("sparql validator: timeout is a warning", "[sparql_validator]") {
  graph g;
  for (int i = 0; i < 40; ++i) {
    g.add(ex("n" + std::to_string(i)), ex("p"), literal::integer(i));
  }
  std::vector<std::string> warnings;
  sparql::query_options opts;
  opts.timeout = std::chrono::milliseconds(0);

  auto results = sparql_validator::validate(
      g, ex("n0"),
      {constraint("SELECT * WHERE { ?a ex:p ?x . ?b ex:p ?y . ?c ex:p ?z }")},
      opts, [&](const std::string& msg) { warnings.push_back(msg); });

  CHECK(results.empty());
  REQUIRE(warnings.size() == 1);
  CHECK(warnings[0].find("exceeded timeout") != std::string::npos);
}
