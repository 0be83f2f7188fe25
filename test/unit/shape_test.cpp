#include <shx/shape.hpp>
#include <shx/vocabulary.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace shx;

TEST_CASE("shape: severities map to and from IRIs", "[shape]") {
  CHECK(severity_iri(severity::violation) == sh::violation);
  CHECK(severity_iri(severity::warning) == sh::warning);
  CHECK(severity_iri(severity::info) == sh::info);

  CHECK(severity_from_iri(sh::warning) == severity::warning);
  CHECK(severity_from_iri(sh::info) == severity::info);
  CHECK(severity_from_iri(sh::violation) == severity::violation);
  CHECK(severity_from_iri(iri("http://example.org/Severe")) ==
        severity::violation);
}

TEST_CASE("shape: node kinds map to and from IRIs", "[shape]") {
  for (auto k : {node_kind::iri, node_kind::blank_node, node_kind::literal,
                 node_kind::blank_node_or_iri,
                 node_kind::blank_node_or_literal,
                 node_kind::iri_or_literal}) {
    CHECK(node_kind_from_iri(node_kind_iri(k)) == k);
  }
  CHECK(node_kind_iri(node_kind::blank_node_or_iri) == sh::blank_node_or_iri);
  CHECK_FALSE(node_kind_from_iri(iri("http://example.org/Kind")));
}

TEST_CASE("shape: pattern searches anywhere in the text", "[shape]") {
  pattern_constraint p("b+");
  CHECK(p.matches("abbc"));
  CHECK_FALSE(p.matches("ac"));
  CHECK(p.source() == "b+");
  CHECK(p.flags().empty());

  pattern_constraint anchored("^a$");
  CHECK_FALSE(anchored.matches("ab"));
}

TEST_CASE("shape: pattern flags", "[shape]") {
  pattern_constraint p("^abc$", "i");
  CHECK(p.matches("ABC"));

  CHECK(pattern_constraint("^b$", "m").matches("a\nb\nc"));
  CHECK_FALSE(pattern_constraint("^b$").matches("a\nb\nc"));

  CHECK(pattern_constraint("a.c", "s").matches("a\nc"));
  CHECK_FALSE(pattern_constraint("a.c").matches("a\nc"));

  pattern_constraint quoted("a.c", "q");
  CHECK(quoted.matches("xa.cx"));
  CHECK_FALSE(quoted.matches("abc"));

  CHECK_THROWS_AS(pattern_constraint("x", "x"), std::invalid_argument);
}

TEST_CASE("shape: pattern matching handles very long text", "[shape]") {
  pattern_constraint p("^[A-Z].*$");
  CHECK(p.matches(std::string(200000, 'A')));
  CHECK_FALSE(p.matches(std::string(200000, 'a')));
}

TEST_CASE("shape: copies of a pattern share one compiled program", "[shape]") {
  pattern_constraint p("^[0-9]+$");
  pattern_constraint copy = p;
  CHECK(copy == p);
  CHECK(copy.matches("42"));
  CHECK_FALSE(copy.matches("4x2"));
}

TEST_CASE("shape: invalid pattern throws", "[shape]") {
  CHECK_THROWS_AS(pattern_constraint("(unclosed"), std::invalid_argument);
}

TEST_CASE("shape: patterns compare by source and flags", "[shape]") {
  CHECK(pattern_constraint("a") == pattern_constraint("a"));
  CHECK_FALSE(pattern_constraint("a") == pattern_constraint("a", "i"));
}

TEST_CASE("shape: constraints default to inactive", "[shape]") {
  property_shape p;
  CHECK(p.severity == severity::violation);
  CHECK_FALSE(p.min_count);
  CHECK_FALSE(p.pattern);
  CHECK(p.in.empty());

  node_shape n;
  CHECK_FALSE(n.implicit_class_target);
  CHECK(n.and_.empty());
  CHECK_FALSE(n.not_);
}
