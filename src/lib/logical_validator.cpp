#include <shx/logical_validator.hpp>

#include <shx/cardinality_validator.hpp>
#include <shx/constraint_helpers.hpp>
#include <shx/qualified_validator.hpp>
#include <shx/string_validator.hpp>
#include <shx/type_validator.hpp>
#include <shx/value_validator.hpp>
#include <shx/vocabulary.hpp>

#include <algorithm>
#include <cstdint>

namespace shx {

  shape_map
  make_shape_map(const std::vector<node_shape>& shapes) {
    shape_map map;
    for (const auto& s : shapes) {
      map.emplace(s.id, &s);
    }
    return map;
  }

} // namespace shx

namespace shx::logical_validator {

  namespace {

    void
    append(validation_results& to, validation_results from) {
      to.insert(to.end(), std::make_move_iterator(from.begin()),
                std::make_move_iterator(from.end()));
    }

    validation_results
    validate_against(const graph& g, const term& focus, const term& ref,
                     const shape_map& shapes, const warning_fn& on_warning,
                     std::size_t depth) {
      auto it = shapes.find(ref);
      if (it == shapes.end()) {
        warn(on_warning, "referenced shape not found: " + to_string(ref));
        return {};
      }
      const node_shape& shape = *it->second;

      validation_results results;
      append(results, type_validator::validate_node(g, focus, shape));
      append(results, string_validator::validate_node(g, focus, shape));
      append(results, value_validator::validate_node(g, focus, shape));
      append(results,
             validate_node(g, focus, shape, shapes, on_warning, depth));
      for (const auto& property : shape.property_shapes) {
        append(results, cardinality_validator::validate(g, focus, property));
        append(results, type_validator::validate(g, focus, property));
        append(results, string_validator::validate(g, focus, property));
        append(results, value_validator::validate(g, focus, property));
        append(results, qualified_validator::validate(g, focus, property));
      }
      return results;
    }

    bool
    conforms(const graph& g, const term& focus, const term& ref,
             const shape_map& shapes, const warning_fn& on_warning,
             std::size_t depth) {
      return validate_against(g, focus, ref, shapes, on_warning, depth).empty();
    }

    std::int64_t
    count_conforming(const graph& g, const term& focus,
                     const std::vector<term>& refs, const shape_map& shapes,
                     const warning_fn& on_warning, std::size_t depth) {
      return std::count_if(refs.begin(), refs.end(), [&](const term& ref) {
        return conforms(g, focus, ref, shapes, on_warning, depth);
      });
    }

  } // namespace

  validation_results
  validate_node(const graph& g, const term& focus, const node_shape& shape,
                const shape_map& shapes, const warning_fn& on_warning,
                std::size_t depth) {
    validation_results results;
    if (depth > max_recursion_depth) {
      warn(on_warning,
           "maximum recursion depth exceeded validating logical operators for " +
               to_string(shape.id));
      return results;
    }
    auto next = depth + 1;
    auto tested = [](const std::vector<term>& refs) {
      return static_cast<std::int64_t>(refs.size());
    };

    if (!shape.and_.empty()) {
      auto passing =
          count_conforming(g, focus, shape.and_, shapes, on_warning, next);
      if (passing != tested(shape.and_)) {
        results.push_back(build_node_violation(
            focus, shape, "AND constraint failed: not all shapes conform",
            {{"constraint_component", term{sh::and_component}},
             {"failing_shapes", tested(shape.and_) - passing}}));
      }
    }

    if (!shape.or_.empty()) {
      bool any = std::any_of(shape.or_.begin(), shape.or_.end(),
                             [&](const term& ref) {
                               return conforms(g, focus, ref, shapes,
                                               on_warning, next);
                             });
      if (!any) {
        results.push_back(build_node_violation(
            focus, shape, "OR constraint failed: no shape conforms",
            {{"constraint_component", term{sh::or_component}},
             {"tested_shapes", tested(shape.or_)}}));
      }
    }

    if (!shape.xone.empty()) {
      auto passing =
          count_conforming(g, focus, shape.xone, shapes, on_warning, next);
      if (passing != 1) {
        results.push_back(build_node_violation(
            focus, shape,
            "XONE constraint failed: " + std::to_string(passing) +
                " shapes conform (expected exactly 1)",
            {{"constraint_component", term{sh::xone_component}},
             {"conforming_count", passing},
             {"tested_shapes", tested(shape.xone)}}));
      }
    }

    if (shape.not_ &&
        conforms(g, focus, *shape.not_, shapes, on_warning, next)) {
      results.push_back(build_node_violation(
          focus, shape, "NOT constraint failed: negated shape conforms",
          {{"constraint_component", term{sh::not_component}},
           {"negated_shape", *shape.not_}}));
    }

    return results;
  }

} // namespace shx::logical_validator
