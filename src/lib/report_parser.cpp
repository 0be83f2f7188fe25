#include <shx/report_parser.hpp>

#include <shx/rdfxml_reader.hpp>
#include <shx/vocabulary.hpp>

#include <utility>

namespace shx {

  namespace {

    [[noreturn]] void
    error(const std::string& msg) {
      throw report_parse_error("report_parser: " + msg);
    }

    // Any literal spelled "true" or "false" is accepted, whatever its
    // datatype or language tag. xsd:boolean also admits "1" and "0".
    bool
    read_conforms(const term& value) {
      if (const auto* lit = std::get_if<literal>(&value)) {
        if (lit->lexical() == "true") return true;
        if (lit->lexical() == "false") return false;
        if (lit->datatype() == xsd::boolean) {
          if (lit->lexical() == "1") return true;
          if (lit->lexical() == "0") return false;
        }
      }
      error("invalid sh:conforms value " + to_string(value));
    }

    validation_result
    read_result(const graph& g, const term& node) {
      validation_result r;

      auto focus = g.object(node, sh::focus_node);
      if (!focus) error("result " + to_string(node) + " has no sh:focusNode");
      r.focus_node = *focus;

      if (auto path = g.object(node, sh::result_path); path && is_iri(*path)) {
        r.result_path = std::get<iri>(*path);
      }
      r.value = g.object(node, sh::value);
      if (auto message = g.object(node, sh::result_message)) {
        if (const auto* lit = std::get_if<literal>(&*message)) {
          r.message = lit->lexical();
        }
      }
      if (auto sev = g.object(node, sh::result_severity); sev && is_iri(*sev)) {
        r.severity = severity_from_iri(std::get<iri>(*sev));
      }
      r.source_shape = g.object(node, sh::source_shape);
      if (auto component = g.object(node, sh::source_constraint_component);
          component && is_iri(*component)) {
        r.constraint_component = std::get<iri>(*component);
      }
      return r;
    }

  } // namespace

  report
  report_parser::parse(std::string_view rdfxml) const {
    graph g;
    try {
      g = parse_rdfxml(rdfxml);
    } catch (const std::runtime_error& e) {
      error(e.what());
    }
    return parse(g);
  }

  report
  report_parser::parse(const graph& g) const {
    auto candidates = g.triples_with(std::nullopt, sh::conforms);
    if (candidates.empty()) error("no validation report found");
    const auto& report_node = candidates.front().subject;

    validation_results results;
    for (const auto& node : g.objects(report_node, sh::result)) {
      results.push_back(read_result(g, node));
    }

    auto r = make_report(std::move(results));
    r.conforms = read_conforms(candidates.front().object);
    return r;
  }

} // namespace shx
