#include <shx/sparql_validator.hpp>

#include <shx/vocabulary.hpp>

#include <re2/re2.h>

namespace shx::sparql_validator {

  namespace {

    void
    replace_all(std::string& text, const std::string& from,
                const std::string& to) {
      std::size_t pos = 0;
      while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
      }
    }

    std::string
    with_prefixes(const sparql_constraint& c, const std::string& query) {
      std::string out;
      for (const auto& [prefix, ns] : c.prefixes) {
        out += "PREFIX " + prefix + ": <" + ns + ">\n";
      }
      return out + query;
    }

    validation_result
    row_to_result(const term& focus, const sparql_constraint& c,
                  const sparql::solution& row) {
      validation_result r;
      r.focus_node = focus;
      r.message = c.message;
      r.source_shape = c.source_shape;
      r.constraint_component = sh::sparql_component;
      for (const auto& [name, value] : row) {
        r.details.emplace(name, value);
      }
      if (auto it = row.find("value"); it != row.end()) r.value = it->second;
      if (auto it = row.find("path"); it != row.end() && is_iri(it->second)) {
        r.result_path = std::get<iri>(it->second);
      }
      return r;
    }

  } // namespace

  std::string
  substitute_this(const std::string& query, const term& focus) {
    std::string out = query;

    if (const auto* i = std::get_if<iri>(&focus)) {
      auto spelled = "<" + i->value() + ">";
      replace_all(out, "SELECT $this", "SELECT ?this");
      replace_all(out, "$this", spelled);
      if (out.find("SELECT ?this") != std::string::npos) {
        static const re2::RE2 where_open(R"(WHERE\s*\{)");
        // Backslashes are escapes in an RE2 rewrite string.
        auto rewrite = "WHERE { BIND(" + spelled + " AS ?this) . ";
        replace_all(rewrite, "\\", "\\\\");
        re2::RE2::Replace(&out, where_open, rewrite);
      }
      return out;
    }

    replace_all(out, "$this", to_string(focus));
    return out;
  }

  validation_results
  validate(const graph& g, const term& focus,
           const std::vector<sparql_constraint>& constraints,
           const sparql::query_options& opts, const warning_fn& on_warning) {
    validation_results results;
    for (const auto& c : constraints) {
      auto query = with_prefixes(c, substitute_this(c.select_query, focus));
      try {
        auto rows = sparql::select(g, query, opts);
        for (const auto& row : rows.rows) {
          results.push_back(row_to_result(focus, c, row));
        }
      } catch (const std::exception& e) {
        warn(on_warning, "SPARQL query execution failed for " +
                             to_string(c.source_shape) + ": " + e.what());
      }
    }
    return results;
  }

} // namespace shx::sparql_validator
