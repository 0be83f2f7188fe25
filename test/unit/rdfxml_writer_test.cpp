#include <shx/rdfxml_reader.hpp>
#include <shx/rdfxml_writer.hpp>
#include <shx/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace shx;

TEST_CASE("rdfxml_writer: declaration and registered prefixes", "[rdfxml]") {
  graph g;
  g.add(iri("http://example.org/a"), rdf::type, sh::validation_report);

  auto xml = to_rdfxml(g);
  CHECK(xml.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n", 0) == 0);
  CHECK(xml.find("xmlns:rdf=\"" + rdf::ns + "\"") != std::string::npos);
  CHECK(xml.find("rdf:about=\"http://example.org/a\"") != std::string::npos);
  CHECK(xml.find("<rdf:type rdf:resource=\"" + sh::ns + "ValidationReport\"/>") !=
        std::string::npos);
}

TEST_CASE("rdfxml_writer: unregistered namespaces get generated prefixes",
          "[rdfxml]") {
  graph g;
  g.add(iri("urn:a"), iri("http://example.org/p"), literal("x"));

  auto xml = to_rdfxml(g);
  CHECK(xml.find("xmlns:ns0=\"http://example.org/\"") != std::string::npos);
  CHECK(xml.find("<ns0:p>x</ns0:p>") != std::string::npos);
}

TEST_CASE("rdfxml_writer: literal annotations", "[rdfxml]") {
  graph g;
  iri s("urn:a");
  g.add(s, iri("http://example.org/plain"), literal("text"));
  g.add(s, iri("http://example.org/lang"), literal::lang_string("hi", "en"));
  g.add(s, iri("http://example.org/num"), literal::integer(7));

  auto xml = to_rdfxml(g);
  CHECK(xml.find("<ns0:plain>text</ns0:plain>") != std::string::npos);
  CHECK(xml.find("<ns0:lang xml:lang=\"en\">hi</ns0:lang>") !=
        std::string::npos);
  CHECK(xml.find("<ns0:num rdf:datatype=\"" + xsd::ns + "integer\">7") !=
        std::string::npos);
}

TEST_CASE("rdfxml_writer: output reads back as the same graph", "[rdfxml]") {
  graph g;
  term report{blank_node("r")};
  term result{blank_node("r1")};
  g.add(report, rdf::type, sh::validation_report);
  g.add(report, sh::conforms, literal::boolean(false));
  g.add(report, sh::result, result);
  g.add(result, sh::focus_node, iri("http://example.org/alice"));
  g.add(result, sh::result_message, literal("a < b & \"c\""));
  g.add(result, sh::value, literal::lang_string("Bonjour", "fr"));
  g.add(result, sh::result_message, literal(""));

  CHECK(parse_rdfxml(to_rdfxml(g)) == g);
}

TEST_CASE("rdfxml_writer: predicate without a local name throws",
          "[rdfxml]") {
  graph g;
  g.add(iri("urn:a"), iri("http://example.org/"), literal("x"));
  CHECK_THROWS_AS(to_rdfxml(g), std::runtime_error);
}
