#include <shx/term.hpp>
#include <shx/vocabulary.hpp>

#include "text_util.hpp"

#include <charconv>
#include <cmath>
#include <sstream>

namespace shx {

  namespace {

    void
    write_escaped(std::ostream& os, const std::string& text) {
      for (char c : text) {
        switch (c) {
          case '"':
            os << "\\\"";
            break;
          case '\\':
            os << "\\\\";
            break;
          case '\n':
            os << "\\n";
            break;
          case '\r':
            os << "\\r";
            break;
          case '\t':
            os << "\\t";
            break;
          default:
            os << c;
            break;
        }
      }
    }

  } // namespace

  literal::literal() : datatype_(xsd::string) {}

  literal::literal(std::string lexical)
      : lexical_(std::move(lexical)), datatype_(xsd::string) {}

  literal::literal(std::string lexical, iri datatype)
      : lexical_(std::move(lexical)), datatype_(std::move(datatype)) {}

  literal
  literal::lang_string(std::string lexical, std::string language) {
    literal l(std::move(lexical), rdf::lang_string);
    l.language_ = detail::to_lower(std::move(language));
    return l;
  }

  literal
  literal::integer(std::int64_t value) {
    return literal(std::to_string(value), xsd::integer);
  }

  literal
  literal::decimal(double value) {
    return literal(format_number(value), xsd::decimal);
  }

  literal
  literal::boolean(bool value) {
    return literal(value ? "true" : "false", xsd::boolean);
  }

  std::optional<std::string>
  literal::language() const {
    if (language_.empty()) { return std::nullopt; }
    return language_;
  }

  std::ostream&
  operator<<(std::ostream& os, const literal& l) {
    os << '"';
    write_escaped(os, l.lexical_);
    os << '"';
    if (!l.language_.empty()) {
      os << '@' << l.language_;
    } else if (l.datatype_ != xsd::string) {
      os << "^^" << l.datatype_;
    }
    return os;
  }

  std::ostream&
  operator<<(std::ostream& os, const term& t) {
    std::visit([&os](const auto& v) { os << v; }, t);
    return os;
  }

  std::string
  to_string(const term& t) {
    std::ostringstream os;
    os << t;
    return os.str();
  }

  std::string
  format_number(double value) {
    if (std::isnan(value)) { return "NaN"; }
    if (std::isinf(value)) { return value < 0 ? "-INF" : "INF"; }
    if (value == 0.0) { return "0"; }

    char buf[512];
    auto [end, ec] =
        std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (ec != std::errc{}) {
      std::ostringstream os;
      os << value;
      return os.str();
    }
    return std::string(buf, end);
  }

} // namespace shx
