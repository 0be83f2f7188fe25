#include <shx/constraint_helpers.hpp>
#include <shx/vocabulary.hpp>

#include "text_util.hpp"

#include <charconv>
#include <cmath>
#include <unordered_set>

namespace shx {

  namespace {

    // Local names of the numeric XSD datatypes.
    const std::unordered_set<std::string> numeric_local_names = {
        "integer",
        "decimal",
        "double",
        "float",
        "int",
        "long",
        "short",
        "byte",
        "nonNegativeInteger",
        "nonPositiveInteger",
        "positiveInteger",
        "negativeInteger",
        "unsignedLong",
        "unsignedInt",
        "unsignedShort",
        "unsignedByte",
    };

    std::optional<double>
    parse_double(std::string_view text) {
      text = detail::trim(text);
      if (!text.empty() && text.front() == '+') text.remove_prefix(1);
      if (text.empty()) return std::nullopt;

      if (text == "INF") return HUGE_VAL;
      if (text == "-INF") return -HUGE_VAL;
      if (text == "NaN") return std::nan("");

      double value = 0;
      auto [end, ec] =
          std::from_chars(text.data(), text.data() + text.size(), value);
      if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
      }
      return value;
    }

    template <typename Shape>
    validation_result
    make_violation(const term& focus, const Shape& shape,
                   std::optional<iri> path, std::string default_message,
                   result_details details, std::optional<term> value) {
      validation_result r;
      r.focus_node = focus;
      r.result_path = std::move(path);
      r.value = std::move(value);
      r.message = shape.message.empty() ? std::move(default_message)
                                        : shape.message;
      r.severity = severity::violation;
      r.source_shape = shape.id;

      if (auto it = details.find("source_shape"); it != details.end()) {
        if (auto* t = std::get_if<term>(&it->second)) r.source_shape = *t;
      }
      if (auto it = details.find("constraint_component");
          it != details.end()) {
        if (auto* t = std::get_if<term>(&it->second)) {
          if (auto* i = std::get_if<iri>(t)) r.constraint_component = *i;
        }
      }
      r.details = std::move(details);
      return r;
    }

  } // namespace

  std::vector<term>
  get_property_values(const graph& g, const term& focus, const iri& path) {
    return g.objects(focus, path);
  }

  bool
  is_instance_of(const graph& g, const term& node, const iri& class_) {
    if (is_literal(node)) return false;
    return g.contains(triple{node, rdf::type, class_});
  }

  bool
  is_datatype(const term& t, const iri& datatype) {
    auto* l = std::get_if<literal>(&t);
    return l != nullptr && l->datatype() == datatype;
  }

  bool
  is_node_kind(const term& t, node_kind kind) {
    switch (kind) {
      case node_kind::iri:
        return is_iri(t);
      case node_kind::blank_node:
        return is_blank_node(t);
      case node_kind::literal:
        return is_literal(t);
      case node_kind::blank_node_or_iri:
        return is_blank_node(t) || is_iri(t);
      case node_kind::blank_node_or_literal:
        return is_blank_node(t) || is_literal(t);
      case node_kind::iri_or_literal:
        return is_iri(t) || is_literal(t);
    }
    return false;
  }

  bool
  is_numeric_datatype(const iri& datatype) {
    const auto& value = datatype.value();
    if (!value.starts_with(xsd::ns)) return false;
    return numeric_local_names.count(value.substr(xsd::ns.size())) != 0;
  }

  std::optional<std::string>
  extract_string(const term& t) {
    if (auto* l = std::get_if<literal>(&t)) return l->lexical();
    return std::nullopt;
  }

  std::optional<double>
  extract_number(const term& t) {
    auto* l = std::get_if<literal>(&t);
    if (l == nullptr || !is_numeric_datatype(l->datatype())) {
      return std::nullopt;
    }
    return parse_double(l->lexical());
  }

  std::optional<std::size_t>
  extract_length(const term& t) {
    auto s = extract_string(t);
    if (!s) return std::nullopt;
    return detail::utf8_length(*s);
  }

  validation_result
  build_violation(const term& focus, const property_shape& shape,
                  std::string default_message, result_details details,
                  std::optional<term> value) {
    return make_violation(focus, shape, shape.path, std::move(default_message),
                          std::move(details), std::move(value));
  }

  validation_result
  build_node_violation(const term& focus, const node_shape& shape,
                       std::string default_message, result_details details,
                       std::optional<term> value) {
    return make_violation(focus, shape, std::nullopt,
                          std::move(default_message), std::move(details),
                          std::move(value));
  }

} // namespace shx
