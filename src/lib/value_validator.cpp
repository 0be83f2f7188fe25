#include <shx/value_validator.hpp>

#include <shx/constraint_helpers.hpp>
#include <shx/vocabulary.hpp>

#include <algorithm>

namespace shx::value_validator {

  namespace {

    struct range_check {
      const char* key;
      const iri* component;
      const char* op;
      const char* failure; // "exceeds maximum", ...
      bool (*holds)(double value, double bound);
    };

    const range_check min_inclusive_check{
        "min_inclusive", &sh::min_inclusive_component, ">=", "is below minimum",
        [](double v, double b) { return v >= b; }};

    const range_check max_inclusive_check{
        "max_inclusive", &sh::max_inclusive_component, "<=", "exceeds maximum",
        [](double v, double b) { return v <= b; }};

    const range_check min_exclusive_check{
        "min_exclusive", &sh::min_exclusive_component, ">",
        "is not above minimum", [](double v, double b) { return v > b; }};

    const range_check max_exclusive_check{
        "max_exclusive", &sh::max_exclusive_component, "<",
        "is not below maximum", [](double v, double b) { return v < b; }};

    template <typename Emit>
    void
    check_range(const range_check& check, const std::optional<term>& bound_term,
                const term& t, const std::string& subject, Emit emit) {
      if (!bound_term) return;
      auto bound = extract_number(*bound_term);
      if (!bound) return;
      auto number = extract_number(t);
      if (!number || check.holds(*number, *bound)) return;

      emit(subject + " " + check.failure + " (expected " + check.op + " " +
               format_number(*bound) + ", found " + format_number(*number) +
               ")",
           result_details{{"constraint_component", term{*check.component}},
                          {check.key, *bound},
                          {"actual_value", *number}});
    }

    bool
    contains(const std::vector<term>& terms, const term& t) {
      return std::find(terms.begin(), terms.end(), t) != terms.end();
    }

  } // namespace

  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape) {
    validation_results results;
    auto values = get_property_values(g, focus, shape.path);

    auto emit_for = [&](const term& value) {
      return [&](std::string message, result_details details) {
        results.push_back(build_violation(focus, shape, std::move(message),
                                          std::move(details), value));
      };
    };

    for (const auto& value : values) {
      if (!shape.in.empty() && !contains(shape.in, value)) {
        emit_for(value)("Value is not one of the allowed values",
                        {{"constraint_component", term{sh::in_component}},
                         {"allowed_values", shape.in},
                         {"actual_value", value}});
      }

      check_range(min_inclusive_check, shape.min_inclusive, value, "Value",
                  emit_for(value));
      check_range(max_inclusive_check, shape.max_inclusive, value, "Value",
                  emit_for(value));
      check_range(min_exclusive_check, shape.min_exclusive, value, "Value",
                  emit_for(value));
      check_range(max_exclusive_check, shape.max_exclusive, value, "Value",
                  emit_for(value));
    }

    if (shape.has_value && !contains(values, *shape.has_value)) {
      results.push_back(build_violation(
          focus, shape, "Required value is missing",
          {{"constraint_component", term{sh::has_value_component}},
           {"required_value", *shape.has_value}}));
    }

    return results;
  }

  validation_results
  validate_node(const graph&, const term& focus, const node_shape& shape) {
    validation_results results;

    auto emit = [&](std::string message, result_details details) {
      results.push_back(build_node_violation(focus, shape, std::move(message),
                                             std::move(details), focus));
    };

    if (!shape.in.empty() && !contains(shape.in, focus)) {
      emit("Focus node is not one of the allowed values",
           {{"constraint_component", term{sh::in_component}},
            {"allowed_values", shape.in},
            {"actual_value", focus}});
    }

    if (shape.has_value && focus != *shape.has_value) {
      emit("Focus node is not the required value",
           {{"constraint_component", term{sh::has_value_component}},
            {"required_value", *shape.has_value}});
    }

    check_range(min_inclusive_check, shape.min_inclusive, focus, "Focus node",
                emit);
    check_range(max_inclusive_check, shape.max_inclusive, focus, "Focus node",
                emit);
    check_range(min_exclusive_check, shape.min_exclusive, focus, "Focus node",
                emit);
    check_range(max_exclusive_check, shape.max_exclusive, focus, "Focus node",
                emit);

    return results;
  }

} // namespace shx::value_validator
