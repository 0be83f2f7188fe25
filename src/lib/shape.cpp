#include <shx/shape.hpp>
#include <shx/vocabulary.hpp>

#include <re2/re2.h>

#include <stdexcept>

namespace shx {

  iri
  severity_iri(severity s) {
    switch (s) {
      case severity::violation:
        return sh::violation;
      case severity::warning:
        return sh::warning;
      case severity::info:
        return sh::info;
    }
    return sh::violation;
  }

  severity
  severity_from_iri(const iri& i) {
    if (i == sh::warning) return severity::warning;
    if (i == sh::info) return severity::info;
    return severity::violation;
  }

  iri
  node_kind_iri(node_kind k) {
    switch (k) {
      case node_kind::iri:
        return sh::iri_kind;
      case node_kind::blank_node:
        return sh::blank_node_kind;
      case node_kind::literal:
        return sh::literal_kind;
      case node_kind::blank_node_or_iri:
        return sh::blank_node_or_iri;
      case node_kind::blank_node_or_literal:
        return sh::blank_node_or_literal;
      case node_kind::iri_or_literal:
        return sh::iri_or_literal;
    }
    return sh::iri_kind;
  }

  std::optional<node_kind>
  node_kind_from_iri(const iri& i) {
    if (i == sh::iri_kind) return node_kind::iri;
    if (i == sh::blank_node_kind) return node_kind::blank_node;
    if (i == sh::literal_kind) return node_kind::literal;
    if (i == sh::blank_node_or_iri) return node_kind::blank_node_or_iri;
    if (i == sh::blank_node_or_literal) return node_kind::blank_node_or_literal;
    if (i == sh::iri_or_literal) return node_kind::iri_or_literal;
    return std::nullopt;
  }

  namespace {

    std::shared_ptr<const re2::RE2>
    compile(const std::string& source, const std::string& flags) {
      re2::RE2::Options options;
      options.set_log_errors(false);
      bool multi_line = false;
      for (char f : flags) {
        switch (f) {
          case 'i':
            options.set_case_sensitive(false);
            break;
          case 's':
            options.set_dot_nl(true);
            break;
          case 'm':
            multi_line = true;
            break;
          case 'q':
            options.set_literal(true);
            break;
          default:
            throw std::invalid_argument("pattern_constraint: unsupported flag '" +
                                        std::string(1, f) + "'");
        }
      }

      // RE2 has no option for multi-line anchors, only the inline form.
      auto program = multi_line && !options.literal() ? "(?m)" + source : source;
      auto regex = std::make_shared<const re2::RE2>(program, options);
      if (!regex->ok()) {
        throw std::invalid_argument("pattern_constraint: invalid pattern \"" +
                                    source + "\": " + regex->error());
      }
      return regex;
    }

  } // namespace

  pattern_constraint::pattern_constraint(std::string source, std::string flags)
      : source_(std::move(source)), flags_(std::move(flags)),
        regex_(compile(source_, flags_)) {}

  bool
  pattern_constraint::matches(const std::string& text) const {
    return re2::RE2::PartialMatch(text, *regex_);
  }

} // namespace shx
