#pragma once

#include <shx/graph.hpp>
#include <shx/xml_writer.hpp>

#include <string>
#include <utility>
#include <vector>

namespace shx {

  // Writes a graph as RDF/XML: one rdf:Description per subject, in the order
  // subjects first appear, with one property element per triple. Every
  // predicate must end in an NCName, and no literal may contain a control
  // character other than TAB, LF or CR. Either failure throws
  // std::runtime_error; such graphs can be written with write_ntriples().
  class rdfxml_writer {
  public:
    rdfxml_writer();

    // Prefix used for `namespace_uri` when the graph uses it. Namespaces
    // without a registered prefix are written as ns0, ns1, ...
    void
    add_prefix(std::string prefix, std::string namespace_uri);

    void
    write(const graph& g, xml_writer& writer) const;

  private:
    std::vector<std::pair<std::string, std::string>> prefixes_;
  };

  std::string
  to_rdfxml(const graph& g);

} // namespace shx
