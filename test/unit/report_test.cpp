#include <shx/report.hpp>
#include <shx/report_writer.hpp>
#include <shx/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace shx;

namespace {

  validation_result
  result(const std::string& focus, severity s, std::string message = "") {
    validation_result r;
    r.focus_node = iri("http://example.org/" + focus);
    r.severity = s;
    r.message = std::move(message);
    return r;
  }

} // namespace

// -- make_report --------------------------------------------------------------

TEST_CASE("report: empty results conform", "[report]") {
  auto r = make_report({});
  CHECK(r.conforms);
  CHECK(r.issue_count() == 0);
  CHECK_FALSE(r.has_violations());
}

TEST_CASE("report: results are bucketed by severity in order", "[report]") {
  auto r = make_report({result("a", severity::warning),
                        result("b", severity::violation),
                        result("c", severity::info),
                        result("d", severity::violation)});

  CHECK_FALSE(r.conforms);
  CHECK(r.has_violations());
  CHECK(r.issue_count() == 4);
  REQUIRE(r.violations.size() == 2);
  CHECK(r.violations[0].focus_node == term{iri("http://example.org/b")});
  CHECK(r.violations[1].focus_node == term{iri("http://example.org/d")});
  REQUIRE(r.warnings.size() == 1);
  REQUIRE(r.info.size() == 1);
}

TEST_CASE("report: warnings and info alone still conform", "[report]") {
  auto r = make_report(
      {result("a", severity::warning), result("b", severity::info)});
  CHECK(r.conforms);
  CHECK(r.issue_count() == 2);
}

// -- to_graph -----------------------------------------------------------------

TEST_CASE("report writer: conforming report", "[report]") {
  auto g = to_graph(make_report({}));
  term node{blank_node("shx-report")};

  CHECK(g.size() == 2);
  CHECK(g.contains({node, rdf::type, sh::validation_report}));
  CHECK(g.object(node, sh::conforms) == term{literal::boolean(true)});
}

TEST_CASE("report writer: result nodes", "[report]") {
  auto v = result("alice", severity::violation, "Too few names");
  v.result_path = iri("http://example.org/name");
  v.value = literal("x");
  v.source_shape = iri("http://example.org/PersonShape");
  v.constraint_component = sh::min_count_component;
  v.details["min_count"] = std::int64_t{1};

  auto g = to_graph(make_report({result("bob", severity::info), v}));
  term report_node{blank_node("shx-report")};
  CHECK(g.object(report_node, sh::conforms) == term{literal::boolean(false)});

  auto results = g.objects(report_node, sh::result);
  REQUIRE(results.size() == 2);
  CHECK(results[0] == term{blank_node("shx-result-0")});

  const auto& first = results[0];
  CHECK(g.contains({first, rdf::type, sh::validation_result}));
  CHECK(g.object(first, sh::focus_node) ==
        term{iri("http://example.org/alice")});
  CHECK(g.object(first, sh::result_path) ==
        term{iri("http://example.org/name")});
  CHECK(g.object(first, sh::value) == term{literal("x")});
  CHECK(g.object(first, sh::result_message) == term{literal("Too few names")});
  CHECK(g.object(first, sh::result_severity) == term{sh::violation});
  CHECK(g.object(first, sh::source_shape) ==
        term{iri("http://example.org/PersonShape")});
  CHECK(g.object(first, sh::source_constraint_component) ==
        term{sh::min_count_component});

  const auto& second = results[1];
  CHECK(g.object(second, sh::result_severity) == term{sh::info});
  CHECK(g.object(second, sh::result_message) == term{literal("")});
  CHECK_FALSE(g.object(second, sh::result_path));
  CHECK_FALSE(g.object(second, sh::source_shape));
}

TEST_CASE("report writer: RDF/XML document", "[report]") {
  auto xml = to_rdfxml(make_report({result("a", severity::violation, "bad")}));
  CHECK(xml.find("xmlns:sh=\"http://www.w3.org/ns/shacl#\"") !=
        std::string::npos);
  CHECK(xml.find("<sh:conforms rdf:datatype=\"" + xsd::ns +
                 "boolean\">false</sh:conforms>") != std::string::npos);
  CHECK(xml.find("<sh:resultMessage>bad</sh:resultMessage>") !=
        std::string::npos);
}
