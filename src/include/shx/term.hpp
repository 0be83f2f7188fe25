#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace shx {

  class iri {
    std::string value_;

  public:
    iri() = default;

    explicit iri(std::string value) : value_(std::move(value)) {}

    const std::string&
    value() const {
      return value_;
    }

    auto
    operator<=>(const iri&) const = default;

    bool
    operator==(const iri&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const iri& i) {
      return os << '<' << i.value_ << '>';
    }
  };

  class blank_node {
    std::string id_;

  public:
    blank_node() = default;

    explicit blank_node(std::string id) : id_(std::move(id)) {}

    const std::string&
    id() const {
      return id_;
    }

    auto
    operator<=>(const blank_node&) const = default;

    bool
    operator==(const blank_node&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const blank_node& b) {
      return os << "_:" << b.id_;
    }
  };

  // An RDF literal. A literal constructed without a datatype is an
  // xsd:string; one with a language tag is an rdf:langString. Language tags
  // are stored lower-cased since they compare case-insensitively.
  class literal {
    std::string lexical_;
    iri datatype_;
    std::string language_;

  public:
    literal();

    explicit literal(std::string lexical);

    literal(std::string lexical, iri datatype);

    static literal
    lang_string(std::string lexical, std::string language);

    static literal
    integer(std::int64_t value);

    static literal
    decimal(double value);

    static literal
    boolean(bool value);

    const std::string&
    lexical() const {
      return lexical_;
    }

    const iri&
    datatype() const {
      return datatype_;
    }

    std::optional<std::string>
    language() const;

    bool
    has_language() const {
      return !language_.empty();
    }

    auto
    operator<=>(const literal&) const = default;

    bool
    operator==(const literal&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const literal& l);
  };

  using term = std::variant<iri, blank_node, literal>;

  inline bool
  is_iri(const term& t) {
    return std::holds_alternative<iri>(t);
  }

  inline bool
  is_blank_node(const term& t) {
    return std::holds_alternative<blank_node>(t);
  }

  inline bool
  is_literal(const term& t) {
    return std::holds_alternative<literal>(t);
  }

  // N-Triples spelling of a term: <iri>, _:id, "lexical"@lang or
  // "lexical"^^<datatype> (the datatype is omitted for xsd:string).
  std::string
  to_string(const term& t);

  std::ostream&
  operator<<(std::ostream& os, const term& t);

  // Shortest decimal spelling of a number: integral values without a
  // fractional part ("300"), others in fixed notation ("2.5").
  std::string
  format_number(double value);

} // namespace shx

template <>
struct std::hash<shx::iri> {
  std::size_t
  operator()(const shx::iri& i) const noexcept {
    return std::hash<std::string>{}(i.value());
  }
};

template <>
struct std::hash<shx::blank_node> {
  std::size_t
  operator()(const shx::blank_node& b) const noexcept {
    return std::hash<std::string>{}(b.id()) * 31;
  }
};

template <>
struct std::hash<shx::literal> {
  std::size_t
  operator()(const shx::literal& l) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(l.lexical());
    std::size_t h2 = std::hash<shx::iri>{}(l.datatype());
    std::size_t h3 = std::hash<std::string>{}(l.language().value_or(""));
    return h1 ^ (h2 << 1) ^ (h3 << 2);
  }
};
