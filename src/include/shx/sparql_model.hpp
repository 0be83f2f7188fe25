#pragma once

#include <shx/term.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace shx::sparql {

  class query_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class query_timeout : public query_error {
  public:
    using query_error::query_error;
  };

  // Forward declarations
  class expression;
  struct group_pattern;

  using expression_ptr = std::unique_ptr<expression>;

  struct variable {
    std::string name;

    bool
    operator==(const variable&) const = default;
  };

  // A position in a triple pattern: a concrete term or a variable.
  using pattern_node = std::variant<term, variable>;

  struct triple_pattern {
    pattern_node subject;
    pattern_node predicate;
    pattern_node object;
  };

  // ---------------------------------------------------------------------------
  // Group graph pattern elements
  // ---------------------------------------------------------------------------

  struct triples_element {
    std::vector<triple_pattern> patterns;
  };

  struct filter_element {
    expression_ptr condition;
  };

  struct optional_element {
    std::unique_ptr<group_pattern> pattern;
  };

  // `{ A } UNION { B } ...`; a nested group on its own is a union with a
  // single alternative.
  struct union_element {
    std::vector<std::unique_ptr<group_pattern>> alternatives;
  };

  struct minus_element {
    std::unique_ptr<group_pattern> pattern;
  };

  struct bind_element {
    expression_ptr value;
    std::string variable;
  };

  struct values_element {
    std::vector<std::string> variables;
    // One entry per variable; nullopt for UNDEF.
    std::vector<std::vector<std::optional<term>>> rows;
  };

  using group_element =
      std::variant<triples_element, filter_element, optional_element,
                   union_element, minus_element, bind_element, values_element>;

  struct group_pattern {
    std::vector<group_element> elements;
  };

  // ---------------------------------------------------------------------------
  // Expression node types
  // ---------------------------------------------------------------------------

  struct constant_expr {
    term value;
  };

  struct variable_expr {
    std::string name;
  };

  enum class unary_op { logical_not, negate, plus };

  struct unary_expr {
    unary_op op;
    expression_ptr operand;
  };

  enum class binary_op {
    logical_or,
    logical_and,
    equal,
    not_equal,
    less,
    less_equal,
    greater,
    greater_equal,
    add,
    subtract,
    multiply,
    divide,
  };

  struct binary_expr {
    binary_op op;
    expression_ptr left;
    expression_ptr right;
  };

  struct in_expr {
    expression_ptr operand;
    std::vector<expression_ptr> list;
    bool negated = false;
  };

  // Built-in function call; `name` is upper case ("STRLEN", "REGEX", ...).
  struct call_expr {
    std::string name;
    std::vector<expression_ptr> args;
  };

  struct exists_expr {
    std::unique_ptr<group_pattern> pattern;
    bool negated = false;
  };

  enum class aggregate_function { count, sum, min, max, avg, sample };

  struct aggregate_expr {
    aggregate_function function;
    bool distinct = false;
    // Null for COUNT(*).
    expression_ptr argument;
  };

  // ---------------------------------------------------------------------------
  // Expression
  // ---------------------------------------------------------------------------

  class expression {
  public:
    using variant_type =
        std::variant<constant_expr, variable_expr, unary_expr, binary_expr,
                     in_expr, call_expr, exists_expr, aggregate_expr>;

    expression(constant_expr v) : data_(std::move(v)) {}

    expression(variable_expr v) : data_(std::move(v)) {}

    expression(unary_expr v) : data_(std::move(v)) {}

    expression(binary_expr v) : data_(std::move(v)) {}

    expression(in_expr v) : data_(std::move(v)) {}

    expression(call_expr v) : data_(std::move(v)) {}

    expression(exists_expr v) : data_(std::move(v)) {}

    expression(aggregate_expr v) : data_(std::move(v)) {}

    expression(const expression&) = delete;
    expression&
    operator=(const expression&) = delete;
    expression(expression&&) = default;
    expression&
    operator=(expression&&) = default;

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

  private:
    variant_type data_;
  };

  // ---------------------------------------------------------------------------
  // Query
  // ---------------------------------------------------------------------------

  struct projection {
    std::string variable;
    // Null for a plain ?var; set for (expr AS ?var).
    expression_ptr value;
  };

  struct order_condition {
    expression_ptr key;
    bool descending = false;
  };

  struct group_condition {
    expression_ptr key;
    // Set for (expr AS ?var) and for a plain ?var.
    std::optional<std::string> variable;
  };

  struct select_query {
    bool distinct = false;
    bool reduced = false;
    bool select_all = false;
    std::vector<projection> projections;
    group_pattern where;
    std::vector<group_condition> group_by;
    std::vector<expression_ptr> having;
    std::vector<order_condition> order_by;
    std::optional<std::size_t> limit;
    std::size_t offset = 0;
  };

} // namespace shx::sparql
