#include <shx/type_validator.hpp>

#include <shx/constraint_helpers.hpp>
#include <shx/vocabulary.hpp>

namespace shx::type_validator {

  validation_results
  validate(const graph& g, const term& focus, const property_shape& shape) {
    validation_results results;
    if (!shape.datatype && !shape.class_) return results;

    for (const auto& value : get_property_values(g, focus, shape.path)) {
      if (shape.datatype && !is_datatype(value, *shape.datatype)) {
        results.push_back(build_violation(
            focus, shape,
            "Value does not have required datatype " +
                to_string(*shape.datatype),
            {{"constraint_component", term{sh::datatype_component}},
             {"expected_datatype", term{*shape.datatype}},
             {"actual_value", value}},
            value));
      }

      if (shape.class_ && !is_instance_of(g, value, *shape.class_)) {
        results.push_back(build_violation(
            focus, shape,
            "Value is not an instance of class " + to_string(*shape.class_),
            {{"constraint_component", term{sh::class_component}},
             {"expected_class", term{*shape.class_}},
             {"actual_value", value}},
            value));
      }
    }
    return results;
  }

  validation_results
  validate_node(const graph& g, const term& focus, const node_shape& shape) {
    validation_results results;

    if (shape.datatype && !is_datatype(focus, *shape.datatype)) {
      results.push_back(build_node_violation(
          focus, shape,
          "Focus node does not have required datatype " +
              to_string(*shape.datatype),
          {{"constraint_component", term{sh::datatype_component}},
           {"expected_datatype", term{*shape.datatype}},
           {"actual_value", focus}},
          focus));
    }

    if (shape.class_ && !is_instance_of(g, focus, *shape.class_)) {
      results.push_back(build_node_violation(
          focus, shape,
          "Focus node is not an instance of class " + to_string(*shape.class_),
          {{"constraint_component", term{sh::class_component}},
           {"expected_class", term{*shape.class_}},
           {"actual_value", focus}},
          focus));
    }

    if (shape.node_kind && !is_node_kind(focus, *shape.node_kind)) {
      auto kind = node_kind_iri(*shape.node_kind);
      results.push_back(build_node_violation(
          focus, shape,
          "Focus node does not match required node kind " + to_string(kind),
          {{"constraint_component", term{sh::node_kind_component}},
           {"expected_node_kind", term{kind}},
           {"actual_value", focus}},
          focus));
    }

    return results;
  }

} // namespace shx::type_validator
