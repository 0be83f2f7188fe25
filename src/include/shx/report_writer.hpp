#pragma once

#include <shx/graph.hpp>
#include <shx/report.hpp>

#include <string>

namespace shx {

  // The report in the SHACL validation report vocabulary: a blank
  // sh:ValidationReport node with sh:conforms and one sh:result blank node
  // per result (violations, then warnings, then info). Result details have
  // no counterpart in the vocabulary and are not written.
  graph
  to_graph(const report& r);

  // to_graph(r) as an RDF/XML document. Throws std::runtime_error when a
  // result value holds a character XML 1.0 cannot carry.
  std::string
  to_rdfxml(const report& r);

} // namespace shx
