#include <shx/sparql_engine.hpp>
#include <shx/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace shx;
using namespace shx::sparql;

namespace {

  const std::string prologue = "PREFIX ex: <http://example.org/>\n";

  iri
  ex(const std::string& local) {
    return iri("http://example.org/" + local);
  }

  graph
  people() {
    graph g;
    g.add(ex("alice"), rdf::type, ex("Person"));
    g.add(ex("alice"), ex("age"), literal::integer(30));
    g.add(ex("alice"), ex("name"), literal::lang_string("Alice", "en"));
    g.add(ex("bob"), rdf::type, ex("Person"));
    g.add(ex("bob"), ex("age"), literal::integer(17));
    g.add(ex("bob"), ex("knows"), ex("alice"));
    g.add(ex("carol"), rdf::type, ex("Person"));
    g.add(ex("carol"), ex("age"), literal("unknown"));
    return g;
  }

  result_set
  run(const graph& g, const std::string& query) {
    return select(g, prologue + query);
  }

  term
  at(const result_set& r, std::size_t row, const std::string& var) {
    return r.rows.at(row).at(var);
  }

} // namespace

// -- Basic graph patterns -----------------------------------------------------

TEST_CASE("sparql engine: triple patterns in data order", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?p WHERE { ?p a ex:Person }");
  CHECK(r.variables == std::vector<std::string>{"p"});
  REQUIRE(r.rows.size() == 3);
  CHECK(at(r, 0, "p") == term{ex("alice")});
  CHECK(at(r, 2, "p") == term{ex("carol")});
}

TEST_CASE("sparql engine: joins share variables", "[sparql_engine]") {
  auto r = run(people(),
               "SELECT ?who ?age WHERE { ?who ex:knows ?f . ?f ex:age ?age }");
  REQUIRE(r.rows.size() == 1);
  CHECK(at(r, 0, "who") == term{ex("bob")});
  CHECK(at(r, 0, "age") == term{literal::integer(30)});
}

TEST_CASE("sparql engine: SELECT * hides anonymous nodes", "[sparql_engine]") {
  auto r = run(people(), "SELECT * WHERE { ?s ex:knows [] }");
  CHECK(r.variables == std::vector<std::string>{"s"});
  REQUIRE(r.rows.size() == 1);
}

TEST_CASE("sparql engine: no match gives no rows", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?s WHERE { ?s ex:missing ?o }");
  CHECK(r.rows.empty());
}

// -- Filters ------------------------------------------------------------------

TEST_CASE("sparql engine: numeric filter skips non-numbers",
          "[sparql_engine]") {
  auto r = run(people(),
               "SELECT ?p WHERE { ?p ex:age ?a FILTER (?a >= 18) }");
  REQUIRE(r.rows.size() == 1);
  CHECK(at(r, 0, "p") == term{ex("alice")});
}

TEST_CASE("sparql engine: string functions", "[sparql_engine]") {
  auto g = people();
  CHECK(run(g, "SELECT ?p WHERE { ?p ex:name ?n "
               "FILTER (LANG(?n) = \"en\" && STRSTARTS(STR(?n), \"Al\")) }")
            .rows.size() == 1);
  CHECK(run(g, "SELECT ?p WHERE { ?p ex:name ?n "
               "FILTER (UCASE(STR(?n)) = \"ALICE\") }")
            .rows.size() == 1);
  CHECK(run(g, "SELECT ?p WHERE { ?p ex:name ?n "
               "FILTER regex(?n, \"^al\", \"i\") }")
            .rows.size() == 1);
  CHECK(run(g, "SELECT ?p WHERE { ?p ex:name ?n FILTER (STRLEN(?n) = 5) }")
            .rows.size() == 1);
  CHECK(run(g, "SELECT ?p WHERE { ?p ex:name ?n "
               "FILTER langMatches(LANG(?n), \"EN\") }")
            .rows.size() == 1);
}

TEST_CASE("sparql engine: invalid regex filters out", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?p WHERE { ?p ex:name ?n "
                         "FILTER regex(?n, \"([\") }");
  CHECK(r.rows.empty());
}

TEST_CASE("sparql engine: term tests and IN", "[sparql_engine]") {
  auto g = people();
  CHECK(run(g, "SELECT ?o WHERE { ?s ex:age ?o FILTER isNumeric(?o) }")
            .rows.size() == 2);
  CHECK(run(g, "SELECT ?o WHERE { ?s ex:knows ?o FILTER isIRI(?o) }")
            .rows.size() == 1);
  CHECK(run(g, "SELECT ?o WHERE { ?s ex:age ?o FILTER (?o IN (17, 30)) }")
            .rows.size() == 2);
  CHECK(run(g, "SELECT ?o WHERE { ?s ex:age ?o FILTER (?o NOT IN (17)) }")
            .rows.size() == 2);
  CHECK(run(g, "SELECT ?s WHERE { ?s ex:age ?o "
               "FILTER (DATATYPE(?o) = <http://www.w3.org/2001/XMLSchema#integer>) }")
            .rows.size() == 2);
}

TEST_CASE("sparql engine: EXISTS and NOT EXISTS", "[sparql_engine]") {
  auto g = people();
  auto known = run(g, "SELECT ?p WHERE { ?p a ex:Person "
                      "FILTER EXISTS { ?x ex:knows ?p } }");
  REQUIRE(known.rows.size() == 1);
  CHECK(at(known, 0, "p") == term{ex("alice")});

  auto unknown = run(g, "SELECT ?p WHERE { ?p a ex:Person "
                        "FILTER NOT EXISTS { ?x ex:knows ?p } }");
  CHECK(unknown.rows.size() == 2);
}

// -- Optional, union, minus, bind, values ------------------------------------

TEST_CASE("sparql engine: OPTIONAL keeps unmatched rows", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?p ?f WHERE { ?p a ex:Person "
                         "OPTIONAL { ?p ex:knows ?f } }");
  REQUIRE(r.rows.size() == 3);
  CHECK(r.rows[0].count("f") == 0);
  CHECK(at(r, 1, "f") == term{ex("alice")});
}

TEST_CASE("sparql engine: BOUND after OPTIONAL", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?p WHERE { ?p a ex:Person "
                         "OPTIONAL { ?p ex:knows ?f } FILTER (!BOUND(?f)) }");
  CHECK(r.rows.size() == 2);
}

TEST_CASE("sparql engine: UNION concatenates", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?x WHERE { { ?x ex:knows ?y } UNION "
                         "{ ?x ex:name ?y } }");
  REQUIRE(r.rows.size() == 2);
  CHECK(at(r, 0, "x") == term{ex("bob")});
  CHECK(at(r, 1, "x") == term{ex("alice")});
}

TEST_CASE("sparql engine: MINUS removes compatible rows", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?p WHERE { ?p a ex:Person "
                         "MINUS { ?p ex:knows ?f } }");
  CHECK(r.rows.size() == 2);

  auto disjoint = run(people(), "SELECT ?p WHERE { ?p a ex:Person "
                                "MINUS { ?q ex:knows ?f } }");
  CHECK(disjoint.rows.size() == 3);
}

TEST_CASE("sparql engine: BIND and arithmetic", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?p ?next WHERE { ?p ex:age ?a "
                         "FILTER isNumeric(?a) BIND (?a + 1 AS ?next) }");
  REQUIRE(r.rows.size() == 2);
  CHECK(at(r, 0, "next") == term{literal::integer(31)});

  auto half = run(people(), "SELECT ?h WHERE { ex:alice ex:age ?a "
                            "BIND (?a / 4 AS ?h) }");
  REQUIRE(half.rows.size() == 1);
  CHECK(at(half, 0, "h") == term{literal("7.5", xsd::decimal)});
}

TEST_CASE("sparql engine: VALUES joins", "[sparql_engine]") {
  auto r = run(people(), "SELECT ?p ?a WHERE { VALUES ?p { ex:bob ex:dave } "
                         "?p ex:age ?a }");
  REQUIRE(r.rows.size() == 1);
  CHECK(at(r, 0, "a") == term{literal::integer(17)});
}

// -- Aggregates and modifiers -------------------------------------------------

TEST_CASE("sparql engine: COUNT over everything", "[sparql_engine]") {
  auto r = run(people(), "SELECT (COUNT(*) AS ?n) WHERE { ?p a ex:Person }");
  REQUIRE(r.rows.size() == 1);
  CHECK(at(r, 0, "n") == term{literal::integer(3)});

  auto none = run(people(), "SELECT (COUNT(?x) AS ?n) WHERE { ?x ex:nope ?y }");
  REQUIRE(none.rows.size() == 1);
  CHECK(at(none, 0, "n") == term{literal::integer(0)});
}

TEST_CASE("sparql engine: GROUP BY with HAVING", "[sparql_engine]") {
  graph g;
  g.add(ex("a"), ex("score"), literal::integer(5));
  g.add(ex("a"), ex("score"), literal::integer(7));
  g.add(ex("b"), ex("score"), literal::integer(1));

  auto r = run(g, "SELECT ?s (SUM(?v) AS ?total) (MAX(?v) AS ?best) "
                  "WHERE { ?s ex:score ?v } GROUP BY ?s "
                  "HAVING (COUNT(?v) > 1)");
  REQUIRE(r.rows.size() == 1);
  CHECK(at(r, 0, "s") == term{ex("a")});
  CHECK(at(r, 0, "total") == term{literal::integer(12)});
  CHECK(at(r, 0, "best") == term{literal::integer(7)});
}

TEST_CASE("sparql engine: ORDER BY, DISTINCT, LIMIT, OFFSET",
          "[sparql_engine]") {
  auto g = people();
  auto ordered = run(g, "SELECT ?p WHERE { ?p ex:age ?a FILTER isNumeric(?a) } "
                        "ORDER BY DESC(?a)");
  REQUIRE(ordered.rows.size() == 2);
  CHECK(at(ordered, 0, "p") == term{ex("alice")});

  auto types = run(g, "SELECT DISTINCT ?t WHERE { ?p a ?t }");
  CHECK(types.rows.size() == 1);

  auto page = run(g, "SELECT ?p WHERE { ?p a ex:Person } "
                     "ORDER BY ?p LIMIT 1 OFFSET 1");
  REQUIRE(page.rows.size() == 1);
  CHECK(at(page, 0, "p") == term{ex("bob")});
}

// -- Blank nodes and errors ---------------------------------------------------

TEST_CASE("sparql engine: blank node labels match data blank nodes",
          "[sparql_engine]") {
  graph g;
  g.add(blank_node("b1"), ex("p"), literal("x"));
  auto r = run(g, "SELECT ?o WHERE { _:b1 ex:p ?o }");
  REQUIRE(r.rows.size() == 1);
  CHECK(at(r, 0, "o") == term{literal("x")});
}

TEST_CASE("sparql engine: parse errors surface as query_error",
          "[sparql_engine]") {
  CHECK_THROWS_AS(select(people(), "SELECT ?s WHERE { ?s ex:p ?o }"),
                  query_error);
}

TEST_CASE("sparql engine: timeout", "[sparql_engine]") {
  graph g;
  for (int i = 0; i < 40; ++i) {
    g.add(ex("n" + std::to_string(i)), ex("p"), literal::integer(i));
  }
  query_options opts;
  opts.timeout = std::chrono::milliseconds(0);
  CHECK_THROWS_AS(select(g, prologue + "SELECT * WHERE { ?a ex:p ?x . "
                                       "?b ex:p ?y . ?c ex:p ?z }",
                         opts),
                  query_timeout);
}
