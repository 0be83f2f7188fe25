#include <shx/report_parser.hpp>
#include <shx/report_writer.hpp>
#include <shx/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace shx;

static report
parse_report(const std::string& xml) {
  return report_parser{}.parse(xml);
}

// -- Documents ----------------------------------------------------------------

TEST_CASE("report parser: conforming report", "[report_parser]") {
  auto r = parse_report(R"(<?xml version="1.0"?>
    <rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#"
             xmlns:sh="http://www.w3.org/ns/shacl#">
      <sh:ValidationReport>
        <sh:conforms rdf:datatype="http://www.w3.org/2001/XMLSchema#boolean">true</sh:conforms>
      </sh:ValidationReport>
    </rdf:RDF>
  )");
  CHECK(r.conforms);
  CHECK(r.issue_count() == 0);
}

TEST_CASE("report parser: results by severity", "[report_parser]") {
  auto r = parse_report(R"(<?xml version="1.0"?>
    <rdf:RDF xmlns:rdf="http://www.w3.org/1999/02/22-rdf-syntax-ns#"
             xmlns:sh="http://www.w3.org/ns/shacl#">
      <sh:ValidationReport>
        <sh:conforms>false</sh:conforms>
        <sh:result>
          <sh:ValidationResult>
            <sh:focusNode rdf:resource="http://example.org/alice"/>
            <sh:resultPath rdf:resource="http://example.org/age"/>
            <sh:value rdf:datatype="http://www.w3.org/2001/XMLSchema#integer">300</sh:value>
            <sh:resultMessage>Too old</sh:resultMessage>
            <sh:resultSeverity rdf:resource="http://www.w3.org/ns/shacl#Violation"/>
            <sh:sourceShape rdf:resource="http://example.org/PersonShape"/>
            <sh:sourceConstraintComponent rdf:resource="http://www.w3.org/ns/shacl#MaxInclusiveConstraintComponent"/>
          </sh:ValidationResult>
        </sh:result>
        <sh:result rdf:parseType="Resource">
          <sh:focusNode rdf:resource="http://example.org/bob"/>
          <sh:resultSeverity rdf:resource="http://www.w3.org/ns/shacl#Warning"/>
        </sh:result>
      </sh:ValidationReport>
    </rdf:RDF>
  )");

  CHECK_FALSE(r.conforms);
  REQUIRE(r.violations.size() == 1);
  REQUIRE(r.warnings.size() == 1);
  CHECK(r.info.empty());

  const auto& v = r.violations[0];
  CHECK(v.focus_node == term{iri("http://example.org/alice")});
  CHECK(v.result_path == iri("http://example.org/age"));
  CHECK(v.value == term{literal::integer(300)});
  CHECK(v.message == "Too old");
  CHECK(v.source_shape == term{iri("http://example.org/PersonShape")});
  CHECK(v.constraint_component == sh::max_inclusive_component);

  CHECK(r.warnings[0].message.empty());
  CHECK(r.warnings[0].focus_node == term{iri("http://example.org/bob")});
}

TEST_CASE("report parser: missing or unknown severity is a violation",
          "[report_parser]") {
  graph g;
  term node{blank_node("r")};
  term res{blank_node("x")};
  g.add(node, sh::conforms, literal::boolean(false));
  g.add(node, sh::result, res);
  g.add(res, sh::focus_node, iri("http://example.org/a"));

  auto r = report_parser{}.parse(g);
  CHECK(r.violations.size() == 1);

  g.add(res, sh::result_severity, iri("http://example.org/Severe"));
  CHECK(report_parser{}.parse(g).violations.size() == 1);
}

TEST_CASE("report parser: conforms comes from the document",
          "[report_parser]") {
  graph g;
  term node{blank_node("r")};
  g.add(node, sh::conforms, literal("1", xsd::boolean));
  CHECK(report_parser{}.parse(g).conforms);

  graph h;
  h.add(node, sh::conforms, literal("false"));
  CHECK_FALSE(report_parser{}.parse(h).conforms);
}

TEST_CASE("report parser: conforms spelled as any literal",
          "[report_parser]") {
  graph g;
  term node{blank_node("r")};
  g.add(node, sh::conforms, literal::lang_string("true", "en"));
  CHECK(report_parser{}.parse(g).conforms);

  graph h;
  h.add(node, sh::conforms, literal("false", iri("urn:custom#flag")));
  CHECK_FALSE(report_parser{}.parse(h).conforms);

  graph k;
  k.add(node, sh::conforms, literal("1", iri("urn:custom#flag")));
  CHECK_THROWS_AS(report_parser{}.parse(k), report_parse_error);
}

// -- Errors -------------------------------------------------------------------

TEST_CASE("report parser: no report node", "[report_parser]") {
  graph g;
  g.add(iri("urn:a"), rdf::type, sh::validation_report);
  CHECK_THROWS_AS(report_parser{}.parse(g), report_parse_error);
}

TEST_CASE("report parser: invalid conforms value", "[report_parser]") {
  graph g;
  g.add(blank_node("r"), sh::conforms, literal("yes"));
  CHECK_THROWS_AS(report_parser{}.parse(g), report_parse_error);

  graph h;
  h.add(blank_node("r"), sh::conforms, iri("urn:true"));
  CHECK_THROWS_AS(report_parser{}.parse(h), report_parse_error);
}

TEST_CASE("report parser: result without focus node", "[report_parser]") {
  graph g;
  term node{blank_node("r")};
  g.add(node, sh::conforms, literal::boolean(true));
  g.add(node, sh::result, blank_node("x"));
  g.add(blank_node("x"), sh::result_message, literal("orphan"));
  CHECK_THROWS_AS(report_parser{}.parse(g), report_parse_error);
}

TEST_CASE("report parser: malformed XML", "[report_parser]") {
  CHECK_THROWS_AS(parse_report("<rdf:RDF"), report_parse_error);
}

TEST_CASE("report parser: reads the writer's output", "[report_parser]") {
  validation_result w;
  w.focus_node = blank_node("n1");
  w.severity = severity::info;
  w.message = "note";
  auto original = make_report({w});

  auto parsed = parse_report(to_rdfxml(original));
  CHECK(parsed == original);
}
