#include <shx/report_writer.hpp>

#include <shx/rdfxml_writer.hpp>
#include <shx/vocabulary.hpp>

namespace shx {

  namespace {

    void
    add_result(graph& g, const term& report_node, const term& node,
               const validation_result& r) {
      g.add(report_node, sh::result, node);
      g.add(node, rdf::type, term{sh::validation_result});
      g.add(node, sh::focus_node, r.focus_node);
      if (r.result_path) g.add(node, sh::result_path, term{*r.result_path});
      if (r.value) g.add(node, sh::value, *r.value);
      g.add(node, sh::result_message, term{literal(r.message)});
      g.add(node, sh::result_severity, term{severity_iri(r.severity)});
      if (r.source_shape) g.add(node, sh::source_shape, *r.source_shape);
      if (r.constraint_component) {
        g.add(node, sh::source_constraint_component,
              term{*r.constraint_component});
      }
    }

  } // namespace

  graph
  to_graph(const report& r) {
    graph g;
    term report_node{blank_node("shx-report")};
    g.add(report_node, rdf::type, term{sh::validation_report});
    g.add(report_node, sh::conforms, term{literal::boolean(r.conforms)});

    std::size_t n = 0;
    for (const auto* bucket : {&r.violations, &r.warnings, &r.info}) {
      for (const auto& result : *bucket) {
        term node{blank_node("shx-result-" + std::to_string(n++))};
        add_result(g, report_node, node, result);
      }
    }
    return g;
  }

  std::string
  to_rdfxml(const report& r) {
    return to_rdfxml(to_graph(r));
  }

} // namespace shx
