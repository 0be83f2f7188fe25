#include <shx/string_validator.hpp>

#include <shx/constraint_helpers.hpp>
#include <shx/vocabulary.hpp>

#include "text_util.hpp"

#include <algorithm>
#include <cstdint>

namespace shx::string_validator {

  namespace {

    std::string
    quoted(const std::string& s) {
      return '"' + s + '"';
    }

    std::int64_t
    count(std::size_t n) {
      return static_cast<std::int64_t>(n);
    }

    // Shared by the property and node variants: `subject` is "Value" or
    // "Focus node", `emit` receives the message and details of a failure.
    template <typename Emit>
    void
    check_string(const term& t, const std::optional<pattern_constraint>& pattern,
                 const std::optional<std::size_t>& min_length,
                 const std::optional<std::size_t>& max_length,
                 const std::string& subject, Emit emit) {
      auto text = extract_string(t);
      if (!text) return;

      if (pattern && !pattern->matches(*text)) {
        emit(subject + " does not match required pattern " +
                 quoted(pattern->source()),
             result_details{
                 {"constraint_component", term{sh::pattern_component}},
                 {"pattern", pattern->source()},
                 {"actual_value", *text}});
      }

      auto length = detail::utf8_length(*text);

      if (min_length && length < *min_length) {
        emit(subject + " is too short (expected at least " +
                 std::to_string(*min_length) + " characters, found " +
                 std::to_string(length) + ")",
             result_details{
                 {"constraint_component", term{sh::min_length_component}},
                 {"min_length", count(*min_length)},
                 {"actual_length", count(length)},
                 {"actual_value", *text}});
      }

      if (max_length && length > *max_length) {
        emit(subject + " is too long (expected at most " +
                 std::to_string(*max_length) + " characters, found " +
                 std::to_string(length) + ")",
             result_details{
                 {"constraint_component", term{sh::max_length_component}},
                 {"max_length", count(*max_length)},
                 {"actual_length", count(length)},
                 {"actual_value", *text}});
      }
    }

  } // namespace

  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape) {
    validation_results results;
    if (!shape.pattern && !shape.min_length && !shape.max_length) {
      return results;
    }

    for (const auto& value : get_property_values(g, focus, shape.path)) {
      check_string(value, shape.pattern, shape.min_length, shape.max_length,
                   "Value", [&](std::string message, result_details details) {
                     results.push_back(build_violation(focus, shape,
                                                       std::move(message),
                                                       std::move(details),
                                                       value));
                   });
    }
    return results;
  }

  validation_results
  validate_node(const graph&, const term& focus, const node_shape& shape) {
    validation_results results;

    check_string(focus, shape.pattern, shape.min_length, shape.max_length,
                 "Focus node",
                 [&](std::string message, result_details details) {
                   results.push_back(build_node_violation(
                       focus, shape, std::move(message), std::move(details),
                       focus));
                 });

    if (shape.language_in.empty()) return results;

    std::vector<std::string> allowed;
    for (const auto& tag : shape.language_in) {
      allowed.push_back(detail::to_lower(tag));
    }

    auto* l = std::get_if<literal>(&focus);
    if (l == nullptr) {
      results.push_back(build_node_violation(
          focus, shape, "Focus node must be a literal with a language tag",
          {{"constraint_component", term{sh::language_in_component}},
           {"allowed_languages", shape.language_in}},
          focus));
    } else if (!l->has_language()) {
      results.push_back(build_node_violation(
          focus, shape, "Focus node must have a language tag",
          {{"constraint_component", term{sh::language_in_component}},
           {"allowed_languages", shape.language_in}},
          focus));
    } else if (std::find(allowed.begin(), allowed.end(), *l->language()) ==
               allowed.end()) {
      results.push_back(build_node_violation(
          focus, shape,
          "Language tag '" + *l->language() + "' is not in the allowed list",
          {{"constraint_component", term{sh::language_in_component}},
           {"allowed_languages", shape.language_in},
           {"actual_language", *l->language()}},
          focus));
    }

    return results;
  }

} // namespace shx::string_validator
