#include <shx/sparql_engine.hpp>

#include <shx/constraint_helpers.hpp>
#include <shx/shape.hpp>
#include <shx/sparql_parser.hpp>
#include <shx/vocabulary.hpp>

#include "text_util.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace shx::sparql {

  namespace {

    using solutions = std::vector<solution>;
    using clock = std::chrono::steady_clock;

    // -----------------------------------------------------------------------
    // Term helpers
    // -----------------------------------------------------------------------

    enum class numeric_rank { integer, decimal, float_, double_ };

    const std::set<std::string> integer_local_names = {
        "integer",         "int",
        "long",            "short",
        "byte",            "nonNegativeInteger",
        "nonPositiveInteger", "positiveInteger",
        "negativeInteger", "unsignedLong",
        "unsignedInt",     "unsignedShort",
        "unsignedByte",
    };

    std::optional<numeric_rank>
    rank_of(const term& t) {
      const auto* lit = std::get_if<literal>(&t);
      if (!lit || !is_numeric_datatype(lit->datatype())) return std::nullopt;
      const auto& dt = lit->datatype();
      if (dt == xsd::double_) return numeric_rank::double_;
      if (dt == xsd::float_) return numeric_rank::float_;
      if (dt == xsd::decimal) return numeric_rank::decimal;
      if (integer_local_names.count(dt.value().substr(xsd::ns.size())) != 0)
        return numeric_rank::integer;
      return std::nullopt;
    }

    term
    make_numeric(double value, numeric_rank rank) {
      switch (rank) {
        case numeric_rank::integer:
          return literal::integer(std::llround(value));
        case numeric_rank::decimal:
          return literal::decimal(value);
        case numeric_rank::float_:
          return literal(format_number(value), xsd::float_);
        case numeric_rank::double_:
          break;
      }
      return literal(format_number(value), xsd::double_);
    }

    term
    make_boolean(bool value) {
      return literal::boolean(value);
    }

    bool
    is_plain_string(const literal& l) {
      return l.datatype() == xsd::string || l.has_language();
    }

    // Effective boolean value; nullopt is a type error.
    std::optional<bool>
    effective_boolean(const std::optional<term>& value) {
      if (!value) return std::nullopt;
      const auto* lit = std::get_if<literal>(&*value);
      if (!lit) return std::nullopt;

      if (lit->datatype() == xsd::boolean) {
        return lit->lexical() == "true" || lit->lexical() == "1";
      }
      if (is_numeric_datatype(lit->datatype())) {
        auto n = extract_number(*value);
        return n && *n != 0 && !std::isnan(*n);
      }
      if (is_plain_string(*lit)) return !lit->lexical().empty();
      return std::nullopt;
    }

    // Ordering of comparable terms: numbers by value, strings and other
    // literals of one datatype by lexical form.
    std::optional<int>
    compare_values(const term& a, const term& b) {
      const auto* la = std::get_if<literal>(&a);
      const auto* lb = std::get_if<literal>(&b);
      if (!la || !lb) return std::nullopt;

      if (rank_of(a) && rank_of(b)) {
        auto na = extract_number(a);
        auto nb = extract_number(b);
        if (!na || !nb) return std::nullopt;
        return *na < *nb ? -1 : (*nb < *na ? 1 : 0);
      }

      if (la->datatype() != lb->datatype() ||
          la->language() != lb->language()) {
        return std::nullopt;
      }
      auto c = la->lexical().compare(lb->lexical());
      return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    bool
    values_equal(const term& a, const term& b) {
      if (auto c = compare_values(a, b)) return *c == 0;
      return a == b;
    }

    // Total order for ORDER BY, MIN and MAX: unbound, blank nodes, IRIs,
    // literals.
    int
    order_terms(const std::optional<term>& a, const std::optional<term>& b) {
      auto kind = [](const std::optional<term>& t) {
        if (!t) return 0;
        if (is_blank_node(*t)) return 1;
        if (is_iri(*t)) return 2;
        return 3;
      };
      auto ka = kind(a);
      auto kb = kind(b);
      if (ka != kb) return ka < kb ? -1 : 1;
      if (ka == 0) return 0;

      if (ka == 3) {
        if (auto c = compare_values(*a, *b)) return *c;
      }
      if (*a < *b) return -1;
      if (*b < *a) return 1;
      return 0;
    }

    std::optional<term>
    arithmetic(binary_op op, const term& a, const term& b) {
      auto ra = rank_of(a);
      auto rb = rank_of(b);
      auto va = extract_number(a);
      auto vb = extract_number(b);
      if (!ra || !rb || !va || !vb) return std::nullopt;

      auto rank = std::max(*ra, *rb);
      switch (op) {
        case binary_op::add:
          return make_numeric(*va + *vb, rank);
        case binary_op::subtract:
          return make_numeric(*va - *vb, rank);
        case binary_op::multiply:
          return make_numeric(*va * *vb, rank);
        case binary_op::divide:
          if (rank == numeric_rank::integer) rank = numeric_rank::decimal;
          if (*vb == 0 && rank == numeric_rank::decimal) return std::nullopt;
          return make_numeric(*va / *vb, rank);
        default:
          return std::nullopt;
      }
    }

    bool
    compatible(const solution& a, const solution& b) {
      for (const auto& [name, value] : a) {
        auto it = b.find(name);
        if (it != b.end() && it->second != value) return false;
      }
      return true;
    }

    bool
    shares_variable(const solution& a, const solution& b) {
      return std::any_of(a.begin(), a.end(), [&](const auto& binding) {
        return b.count(binding.first) != 0;
      });
    }

    solution
    merged(solution a, const solution& b) {
      a.insert(b.begin(), b.end());
      return a;
    }

    // -----------------------------------------------------------------------
    // Static query analysis
    // -----------------------------------------------------------------------

    bool
    contains_aggregate(const expression& e) {
      return std::visit(
          [](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, aggregate_expr>) {
              return true;
            } else if constexpr (std::is_same_v<T, unary_expr>) {
              return contains_aggregate(*node.operand);
            } else if constexpr (std::is_same_v<T, binary_expr>) {
              return contains_aggregate(*node.left) ||
                     contains_aggregate(*node.right);
            } else if constexpr (std::is_same_v<T, in_expr>) {
              if (contains_aggregate(*node.operand)) return true;
              return std::any_of(
                  node.list.begin(), node.list.end(),
                  [](const auto& item) { return contains_aggregate(*item); });
            } else if constexpr (std::is_same_v<T, call_expr>) {
              return std::any_of(
                  node.args.begin(), node.args.end(),
                  [](const auto& arg) { return contains_aggregate(*arg); });
            } else {
              return false;
            }
          },
          e.data());
    }

    void
    add_variable(std::vector<std::string>& out, const std::string& name) {
      if (name.empty() || name.front() == '.') return;
      if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(name);
      }
    }

    // In-scope variables of a group, in order of appearance.
    void
    collect_variables(const group_pattern& g, std::vector<std::string>& out) {
      auto add_node = [&](const pattern_node& n) {
        if (const auto* v = std::get_if<variable>(&n)) add_variable(out, v->name);
      };
      for (const auto& element : g.elements) {
        std::visit(
            [&](const auto& node) {
              using T = std::decay_t<decltype(node)>;
              if constexpr (std::is_same_v<T, triples_element>) {
                for (const auto& tp : node.patterns) {
                  add_node(tp.subject);
                  add_node(tp.predicate);
                  add_node(tp.object);
                }
              } else if constexpr (std::is_same_v<T, optional_element>) {
                collect_variables(*node.pattern, out);
              } else if constexpr (std::is_same_v<T, union_element>) {
                for (const auto& alt : node.alternatives) {
                  collect_variables(*alt, out);
                }
              } else if constexpr (std::is_same_v<T, bind_element>) {
                add_variable(out, node.variable);
              } else if constexpr (std::is_same_v<T, values_element>) {
                for (const auto& v : node.variables) add_variable(out, v);
              }
            },
            element);
      }
    }

    // -----------------------------------------------------------------------
    // Evaluator
    // -----------------------------------------------------------------------

    class evaluator {
    public:
      evaluator(const graph& g, const query_options& opts) : g_(g) {
        if (opts.timeout) {
          deadline_ = clock::now() + *opts.timeout;
          budget_ = *opts.timeout;
        }
      }

      solutions
      eval_group(const group_pattern& group, solutions input) {
        solutions current = std::move(input);
        std::vector<const expression*> filters;

        for (const auto& element : group.elements) {
          std::visit(
              [&](const auto& node) {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, triples_element>) {
                  current = match_triples(node.patterns, std::move(current));
                } else if constexpr (std::is_same_v<T, filter_element>) {
                  filters.push_back(node.condition.get());
                } else if constexpr (std::is_same_v<T, optional_element>) {
                  current = left_join(*node.pattern, std::move(current));
                } else if constexpr (std::is_same_v<T, union_element>) {
                  solutions out;
                  for (const auto& alt : node.alternatives) {
                    auto part = eval_group(*alt, current);
                    out.insert(out.end(), std::make_move_iterator(part.begin()),
                               std::make_move_iterator(part.end()));
                  }
                  current = std::move(out);
                } else if constexpr (std::is_same_v<T, minus_element>) {
                  current = minus(*node.pattern, std::move(current));
                } else if constexpr (std::is_same_v<T, bind_element>) {
                  for (auto& s : current) {
                    tick();
                    if (s.count(node.variable) != 0) continue;
                    if (auto v = eval(*node.value, s)) {
                      s.emplace(node.variable, std::move(*v));
                    }
                  }
                } else if constexpr (std::is_same_v<T, values_element>) {
                  current = join_values(node, std::move(current));
                }
              },
              element);
        }

        if (filters.empty()) return current;

        solutions kept;
        for (auto& s : current) {
          tick();
          bool pass = std::all_of(
              filters.begin(), filters.end(), [&](const expression* f) {
                return effective_boolean(eval(*f, s)).value_or(false);
              });
          if (pass) kept.push_back(std::move(s));
        }
        return kept;
      }

      // Evaluates `e` against `s`. `group` is the solution group when
      // aggregates are allowed. Errors and unbound variables give nullopt.
      std::optional<term>
      eval(const expression& e, const solution& s,
           const solutions* group = nullptr) {
        return std::visit(
            [&](const auto& node) -> std::optional<term> {
              using T = std::decay_t<decltype(node)>;
              if constexpr (std::is_same_v<T, constant_expr>) {
                return node.value;
              } else if constexpr (std::is_same_v<T, variable_expr>) {
                auto it = s.find(node.name);
                if (it == s.end()) return std::nullopt;
                return it->second;
              } else if constexpr (std::is_same_v<T, unary_expr>) {
                return eval_unary(node, s, group);
              } else if constexpr (std::is_same_v<T, binary_expr>) {
                return eval_binary(node, s, group);
              } else if constexpr (std::is_same_v<T, in_expr>) {
                return eval_in(node, s, group);
              } else if constexpr (std::is_same_v<T, call_expr>) {
                return eval_call(node, s, group);
              } else if constexpr (std::is_same_v<T, exists_expr>) {
                bool found = !eval_group(*node.pattern, {s}).empty();
                return make_boolean(found != node.negated);
              } else {
                return eval_aggregate(node, group);
              }
            },
            e.data());
      }

    private:
      const graph& g_;
      std::optional<clock::time_point> deadline_;
      std::chrono::milliseconds budget_{0};
      std::size_t steps_ = 0;
      std::unordered_map<std::string, pattern_constraint> regex_cache_;

      void
      tick() {
        if (!deadline_ || ++steps_ % 256 != 0) return;
        if (clock::now() > *deadline_) {
          throw query_timeout("query exceeded timeout of " +
                              std::to_string(budget_.count()) + " ms");
        }
      }

      // ---------------------------------------------------------------------
      // Graph patterns
      // ---------------------------------------------------------------------

      static std::optional<term>
      resolve(const pattern_node& n, const solution& s) {
        if (const auto* t = std::get_if<term>(&n)) return *t;
        auto it = s.find(std::get<variable>(n).name);
        if (it == s.end()) return std::nullopt;
        return it->second;
      }

      static bool
      bind(solution& s, const pattern_node& n, const term& value) {
        const auto* v = std::get_if<variable>(&n);
        if (!v) return true;
        auto [it, inserted] = s.emplace(v->name, value);
        return inserted || it->second == value;
      }

      void
      match_pattern(const triple_pattern& tp, const solution& s,
                    solutions& out) {
        auto subject = resolve(tp.subject, s);
        auto predicate = resolve(tp.predicate, s);
        auto object = resolve(tp.object, s);

        if (subject && is_literal(*subject)) return;
        std::optional<iri> predicate_iri;
        if (predicate) {
          if (!is_iri(*predicate)) return;
          predicate_iri = std::get<iri>(*predicate);
        }

        g_.for_each_match(subject, predicate_iri, [&](const triple& t) {
          tick();
          if (object && *object != t.object) return true;
          solution extended = s;
          if (bind(extended, tp.subject, t.subject) &&
              bind(extended, tp.predicate, term{t.predicate}) &&
              bind(extended, tp.object, t.object)) {
            out.push_back(std::move(extended));
          }
          return true;
        });
      }

      solutions
      match_triples(const std::vector<triple_pattern>& patterns,
                    solutions current) {
        for (const auto& tp : patterns) {
          solutions next;
          for (const auto& s : current) {
            match_pattern(tp, s, next);
          }
          current = std::move(next);
          if (current.empty()) break;
        }
        return current;
      }

      solutions
      left_join(const group_pattern& pattern, solutions current) {
        solutions out;
        for (auto& s : current) {
          tick();
          auto extended = eval_group(pattern, {s});
          if (extended.empty()) {
            out.push_back(std::move(s));
          } else {
            out.insert(out.end(), std::make_move_iterator(extended.begin()),
                       std::make_move_iterator(extended.end()));
          }
        }
        return out;
      }

      solutions
      minus(const group_pattern& pattern, solutions current) {
        auto removed = eval_group(pattern, {solution{}});
        solutions out;
        for (auto& s : current) {
          tick();
          bool drop = std::any_of(
              removed.begin(), removed.end(), [&](const solution& r) {
                return shares_variable(s, r) && compatible(s, r);
              });
          if (!drop) out.push_back(std::move(s));
        }
        return out;
      }

      solutions
      join_values(const values_element& values, solutions current) {
        solutions out;
        for (const auto& s : current) {
          for (const auto& row : values.rows) {
            tick();
            solution r;
            for (std::size_t i = 0; i < values.variables.size(); ++i) {
              if (row[i]) r.emplace(values.variables[i], *row[i]);
            }
            if (compatible(s, r)) out.push_back(merged(s, r));
          }
        }
        return out;
      }

      // ---------------------------------------------------------------------
      // Expressions
      // ---------------------------------------------------------------------

      std::optional<term>
      eval_unary(const unary_expr& e, const solution& s,
                 const solutions* group) {
        auto v = eval(*e.operand, s, group);
        if (e.op == unary_op::logical_not) {
          auto b = effective_boolean(v);
          if (!b) return std::nullopt;
          return make_boolean(!*b);
        }
        if (!v) return std::nullopt;
        auto rank = rank_of(*v);
        auto n = extract_number(*v);
        if (!rank || !n) return std::nullopt;
        return make_numeric(e.op == unary_op::negate ? -*n : *n, *rank);
      }

      std::optional<term>
      eval_binary(const binary_expr& e, const solution& s,
                  const solutions* group) {
        if (e.op == binary_op::logical_or || e.op == binary_op::logical_and) {
          auto l = effective_boolean(eval(*e.left, s, group));
          auto r = effective_boolean(eval(*e.right, s, group));
          bool decisive = e.op == binary_op::logical_or;
          if (l == decisive || r == decisive) return make_boolean(decisive);
          if (!l || !r) return std::nullopt;
          return make_boolean(!decisive);
        }

        auto l = eval(*e.left, s, group);
        auto r = eval(*e.right, s, group);
        if (!l || !r) return std::nullopt;

        switch (e.op) {
          case binary_op::equal:
            return make_boolean(values_equal(*l, *r));
          case binary_op::not_equal:
            return make_boolean(!values_equal(*l, *r));
          case binary_op::less:
          case binary_op::less_equal:
          case binary_op::greater:
          case binary_op::greater_equal: {
            auto c = compare_values(*l, *r);
            if (!c) return std::nullopt;
            if (e.op == binary_op::less) return make_boolean(*c < 0);
            if (e.op == binary_op::less_equal) return make_boolean(*c <= 0);
            if (e.op == binary_op::greater) return make_boolean(*c > 0);
            return make_boolean(*c >= 0);
          }
          default:
            return arithmetic(e.op, *l, *r);
        }
      }

      std::optional<term>
      eval_in(const in_expr& e, const solution& s, const solutions* group) {
        auto v = eval(*e.operand, s, group);
        if (!v) return std::nullopt;
        bool error = false;
        for (const auto& item : e.list) {
          auto x = eval(*item, s, group);
          if (!x) {
            error = true;
          } else if (values_equal(*v, *x)) {
            return make_boolean(!e.negated);
          }
        }
        if (error) return std::nullopt;
        return make_boolean(e.negated);
      }

      const pattern_constraint*
      compiled_regex(const std::string& source, const std::string& flags) {
        auto key = flags + '/' + source;
        auto it = regex_cache_.find(key);
        if (it == regex_cache_.end()) {
          try {
            it = regex_cache_.emplace(key, pattern_constraint(source, flags))
                     .first;
          } catch (const std::invalid_argument&) {
            return nullptr;
          }
        }
        return &it->second;
      }

      std::optional<term>
      eval_call(const call_expr& call, const solution& s,
                const solutions* group) {
        const auto& name = call.name;

        if (name == "BOUND") {
          const auto& var = call.args[0]->get<variable_expr>();
          return make_boolean(s.count(var.name) != 0);
        }
        if (name == "IF") {
          auto c = effective_boolean(eval(*call.args[0], s, group));
          if (!c) return std::nullopt;
          return eval(*call.args[*c ? 1 : 2], s, group);
        }
        if (name == "COALESCE") {
          for (const auto& arg : call.args) {
            if (auto v = eval(*arg, s, group)) return v;
          }
          return std::nullopt;
        }

        std::vector<term> args;
        for (const auto& arg : call.args) {
          auto v = eval(*arg, s, group);
          if (!v) return std::nullopt;
          args.push_back(std::move(*v));
        }
        const term& a = args[0];
        const auto* lit = std::get_if<literal>(&a);

        if (name == "ISIRI" || name == "ISURI") return make_boolean(is_iri(a));
        if (name == "ISBLANK") return make_boolean(is_blank_node(a));
        if (name == "ISLITERAL") return make_boolean(is_literal(a));
        if (name == "ISNUMERIC") {
          return make_boolean(rank_of(a) && extract_number(a));
        }
        if (name == "SAMETERM") return make_boolean(args[0] == args[1]);
        if (name == "STR") {
          if (const auto* i = std::get_if<iri>(&a)) return literal(i->value());
          if (lit) return literal(lit->lexical());
          return std::nullopt;
        }

        // The remaining functions take a literal first argument.
        if (!lit) return std::nullopt;

        if (name == "LANG") return literal(lit->language().value_or(""));
        if (name == "DATATYPE") return lit->datatype();
        if (name == "STRLEN") {
          return literal::integer(static_cast<std::int64_t>(
              detail::utf8_length(lit->lexical())));
        }
        if (name == "UCASE" || name == "LCASE") {
          auto text = name == "UCASE" ? detail::to_upper(lit->lexical())
                                      : detail::to_lower(lit->lexical());
          if (auto lang = lit->language()) {
            return literal::lang_string(std::move(text), *lang);
          }
          return literal(std::move(text), lit->datatype());
        }

        auto second = args.size() > 1 ? extract_string(args[1]) : std::nullopt;
        if (!second) return std::nullopt;
        const auto& text = lit->lexical();

        if (name == "CONTAINS") {
          return make_boolean(text.find(*second) != std::string::npos);
        }
        if (name == "STRSTARTS") return make_boolean(text.starts_with(*second));
        if (name == "STRENDS") return make_boolean(text.ends_with(*second));
        if (name == "LANGMATCHES") {
          if (*second == "*") return make_boolean(!text.empty());
          auto tag = detail::to_lower(text);
          auto range = detail::to_lower(*second);
          return make_boolean(tag == range || tag.starts_with(range + "-"));
        }
        if (name == "REGEX") {
          std::string flags;
          if (args.size() > 2) {
            auto f = extract_string(args[2]);
            if (!f) return std::nullopt;
            flags = *f;
          }
          const auto* re = compiled_regex(*second, flags);
          if (!re) return std::nullopt;
          return make_boolean(re->matches(text));
        }
        return std::nullopt;
      }

      std::optional<term>
      eval_aggregate(const aggregate_expr& agg, const solutions* group) {
        if (!group) return std::nullopt;

        if (!agg.argument) {
          if (!agg.distinct) {
            return literal::integer(static_cast<std::int64_t>(group->size()));
          }
          std::set<solution> unique(group->begin(), group->end());
          return literal::integer(static_cast<std::int64_t>(unique.size()));
        }

        std::vector<term> values;
        for (const auto& s : *group) {
          if (auto v = eval(*agg.argument, s)) values.push_back(std::move(*v));
        }
        if (agg.distinct) {
          std::vector<term> unique;
          for (auto& v : values) {
            if (std::find(unique.begin(), unique.end(), v) == unique.end()) {
              unique.push_back(std::move(v));
            }
          }
          values = std::move(unique);
        }

        switch (agg.function) {
          case aggregate_function::count:
            return literal::integer(static_cast<std::int64_t>(values.size()));
          case aggregate_function::sample:
            if (values.empty()) return std::nullopt;
            return values.front();
          case aggregate_function::min:
          case aggregate_function::max: {
            if (values.empty()) return std::nullopt;
            bool want_min = agg.function == aggregate_function::min;
            auto best = values.front();
            for (const auto& v : values) {
              int c = order_terms(v, best);
              if (want_min ? c < 0 : c > 0) best = v;
            }
            return best;
          }
          case aggregate_function::sum:
          case aggregate_function::avg: {
            std::optional<term> total = literal::integer(0);
            for (const auto& v : values) {
              total = arithmetic(binary_op::add, *total, v);
              if (!total) return std::nullopt;
            }
            if (agg.function == aggregate_function::sum) return total;
            if (values.empty()) return literal::integer(0);
            return arithmetic(
                binary_op::divide, *total,
                literal::integer(static_cast<std::int64_t>(values.size())));
          }
        }
        return std::nullopt;
      }
    };

    // -----------------------------------------------------------------------
    // Solution modifiers
    // -----------------------------------------------------------------------

    // A row before projection, with the group it summarises when the
    // query aggregates.
    struct row {
      solution bindings;
      const solutions* group = nullptr;
    };

    bool
    is_aggregate_query(const select_query& q) {
      if (!q.group_by.empty() || !q.having.empty()) return true;
      for (const auto& p : q.projections) {
        if (p.value && contains_aggregate(*p.value)) return true;
      }
      for (const auto& o : q.order_by) {
        if (contains_aggregate(*o.key)) return true;
      }
      return false;
    }

    // Partitions `input` by the GROUP BY keys, keeping first-seen order.
    // Without GROUP BY the whole input is one group, even when empty.
    std::vector<std::pair<solution, solutions>>
    group_solutions(evaluator& ev, const select_query& q, solutions input) {
      std::vector<std::pair<solution, solutions>> groups;
      if (q.group_by.empty()) {
        groups.emplace_back(solution{}, std::move(input));
        return groups;
      }

      std::map<std::vector<std::optional<term>>, std::size_t> index;
      for (auto& s : input) {
        std::vector<std::optional<term>> key;
        solution bindings;
        for (const auto& condition : q.group_by) {
          auto v = ev.eval(*condition.key, s);
          if (v && condition.variable) bindings.emplace(*condition.variable, *v);
          key.push_back(std::move(v));
        }
        auto [it, inserted] = index.emplace(std::move(key), groups.size());
        if (inserted) groups.emplace_back(std::move(bindings), solutions{});
        groups[it->second].second.push_back(std::move(s));
      }
      return groups;
    }

  } // namespace

  result_set
  execute(const graph& g, const select_query& query,
          const query_options& opts) {
    evaluator ev(g, opts);
    auto matched = ev.eval_group(query.where, {solution{}});

    std::vector<std::pair<solution, solutions>> groups;
    std::vector<row> rows;
    if (is_aggregate_query(query)) {
      groups = group_solutions(ev, query, std::move(matched));
      for (const auto& [bindings, members] : groups) {
        solution base = bindings;
        // Variables outside the GROUP BY keys take the first member's
        // binding.
        if (!members.empty()) base.insert(members.front().begin(),
                                          members.front().end());
        bool keep = std::all_of(
            query.having.begin(), query.having.end(), [&](const auto& h) {
              return effective_boolean(ev.eval(*h, base, &members))
                  .value_or(false);
            });
        if (keep) rows.push_back({std::move(base), &members});
      }
    } else {
      for (auto& s : matched) {
        rows.push_back({std::move(s), nullptr});
      }
    }

    for (auto& r : rows) {
      for (const auto& p : query.projections) {
        if (!p.value) continue;
        if (auto v = ev.eval(*p.value, r.bindings, r.group)) {
          r.bindings.insert_or_assign(p.variable, std::move(*v));
        }
      }
    }

    if (!query.order_by.empty()) {
      std::vector<std::pair<std::vector<std::optional<term>>, row>> keyed;
      for (auto& r : rows) {
        std::vector<std::optional<term>> keys;
        for (const auto& o : query.order_by) {
          keys.push_back(ev.eval(*o.key, r.bindings, r.group));
        }
        keyed.emplace_back(std::move(keys), std::move(r));
      }
      std::stable_sort(keyed.begin(), keyed.end(),
                       [&](const auto& a, const auto& b) {
                         for (std::size_t i = 0; i < query.order_by.size();
                              ++i) {
                           int c = order_terms(a.first[i], b.first[i]);
                           if (c != 0) {
                             return query.order_by[i].descending ? c > 0
                                                                 : c < 0;
                           }
                         }
                         return false;
                       });
      rows.clear();
      for (auto& [keys, r] : keyed) {
        rows.push_back(std::move(r));
      }
    }

    result_set result;
    if (query.select_all) {
      collect_variables(query.where, result.variables);
    } else {
      for (const auto& p : query.projections) {
        add_variable(result.variables, p.variable);
      }
    }

    std::set<solution> seen;
    std::size_t skipped = 0;
    for (const auto& r : rows) {
      if (query.limit && result.rows.size() >= *query.limit) break;

      solution projected;
      for (const auto& name : result.variables) {
        auto it = r.bindings.find(name);
        if (it != r.bindings.end()) projected.emplace(name, it->second);
      }
      if ((query.distinct || query.reduced) &&
          !seen.insert(projected).second) {
        continue;
      }
      if (skipped < query.offset) {
        ++skipped;
        continue;
      }
      result.rows.push_back(std::move(projected));
    }
    return result;
  }

  result_set
  select(const graph& g, const std::string& query, const query_options& opts) {
    query_parser parser;
    return execute(g, parser.parse(query), opts);
  }

} // namespace shx::sparql
