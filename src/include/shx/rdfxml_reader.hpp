#pragma once

#include <shx/graph.hpp>
#include <shx/xml_reader.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace shx {

  // Reads the striped RDF/XML syntax into a graph: rdf:RDF (or a single
  // node element) holding rdf:Description and typed node elements with
  // rdf:about / rdf:nodeID subjects, property attributes, and property
  // elements carrying rdf:resource, rdf:nodeID, rdf:datatype, xml:lang,
  // rdf:parseType="Resource" or a nested node element. Anything else throws
  // std::runtime_error.
  class rdfxml_reader {
  public:
    graph
    parse(xml_reader& reader);

  private:
    std::size_t next_blank_ = 0;

    blank_node
    fresh_blank_node();

    term
    parse_node_element(xml_reader& reader, graph& g, const std::string& lang);

    void
    parse_property_elements(xml_reader& reader, graph& g, const term& subject,
                            const std::string& lang);

    void
    parse_property_element(xml_reader& reader, graph& g, const term& subject,
                           const std::string& lang);
  };

  graph
  parse_rdfxml(std::string_view xml);

} // namespace shx
