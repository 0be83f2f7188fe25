#pragma once

#include <shx/shape.hpp>
#include <shx/term.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace shx {

  using detail_value = std::variant<std::string, std::int64_t, double, term,
                                    std::vector<term>, std::vector<std::string>>;

  // Structured context of a result, keyed by names such as "actual_value" or
  // "min_count". The key "constraint_component" holds an IRI term.
  using result_details = std::map<std::string, detail_value>;

  struct validation_result {
    term focus_node;
    std::optional<iri> result_path;
    std::optional<term> value;
    std::string message;
    shx::severity severity = shx::severity::violation;
    std::optional<term> source_shape;
    std::optional<iri> constraint_component;
    result_details details;

    bool
    operator==(const validation_result&) const = default;
  };

  using validation_results = std::vector<validation_result>;

} // namespace shx
