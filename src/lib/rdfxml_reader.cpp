#include <shx/rdfxml_reader.hpp>

#include <shx/expat_reader.hpp>
#include <shx/vocabulary.hpp>

#include <cctype>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace shx {

  namespace {

    const qname rdf_RDF{rdf::ns, "RDF"};
    const qname rdf_Description{rdf::ns, "Description"};
    const qname rdf_about{rdf::ns, "about"};
    const qname rdf_nodeID{rdf::ns, "nodeID"};
    const qname rdf_ID{rdf::ns, "ID"};
    const qname rdf_resource{rdf::ns, "resource"};
    const qname rdf_datatype{rdf::ns, "datatype"};
    const qname rdf_parseType{rdf::ns, "parseType"};
    const qname rdf_type{rdf::ns, "type"};
    const qname xml_lang{xml::ns, "lang"};

    [[noreturn]] void
    error(const xml_reader& reader, const std::string& msg) {
      throw std::runtime_error("rdfxml_reader (line " +
                               std::to_string(reader.line()) + "): " + msg);
    }

    bool
    is_whitespace(std::string_view text) {
      for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
      }
      return true;
    }

    std::string
    element_lang(const xml_reader& reader, const std::string& inherited) {
      if (auto lang = reader.find_attribute(xml_lang)) {
        return std::string(*lang);
      }
      return inherited;
    }

    // Attributes in the rdf namespace that steer parsing rather than state a
    // property.
    bool
    is_syntax_attribute(const qname& name) {
      if (name.namespace_uri() == xml::ns) return true;
      if (name.namespace_uri().empty()) return true;
      return name == rdf_about || name == rdf_nodeID || name == rdf_ID ||
             name == rdf_resource || name == rdf_datatype ||
             name == rdf_parseType;
    }

    literal
    make_literal(std::string text, const std::string& lang) {
      if (lang.empty()) return literal(std::move(text));
      return literal::lang_string(std::move(text), lang);
    }

    // Property attributes of the current element, added with `subject` as
    // subject. rdf:type names a resource; every other attribute is a literal.
    void
    add_property_attributes(const xml_reader& reader, graph& g,
                            const term& subject, const std::string& lang) {
      for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
        const auto& name = reader.attribute_name(i);
        if (is_syntax_attribute(name)) continue;
        std::string value(reader.attribute_value(i));
        if (name == rdf_type) {
          g.add(subject, rdf::type, iri(std::move(value)));
        } else {
          g.add(subject, iri(name.to_iri()), make_literal(std::move(value), lang));
        }
      }
    }

    bool
    has_property_attributes(const xml_reader& reader) {
      for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
        if (!is_syntax_attribute(reader.attribute_name(i))) return true;
      }
      return false;
    }

    // Consume the rest of an element that must have no content.
    void
    skip_empty_element(xml_reader& reader) {
      while (reader.read()) {
        switch (reader.node_type()) {
          case xml_node_type::end_element:
            return;
          case xml_node_type::characters:
            if (!is_whitespace(reader.text())) {
              error(reader, "unexpected text in empty property element");
            }
            break;
          case xml_node_type::start_element:
            error(reader, "unexpected element in empty property element");
        }
      }
      error(reader, "unexpected end of document");
    }

  } // namespace

  blank_node
  rdfxml_reader::fresh_blank_node() {
    return blank_node("genid" + std::to_string(next_blank_++));
  }

  graph
  rdfxml_reader::parse(xml_reader& reader) {
    graph g;
    while (reader.read()) {
      if (reader.node_type() != xml_node_type::start_element) continue;

      if (reader.name() != rdf_RDF) {
        parse_node_element(reader, g, "");
        return g;
      }

      std::string lang = element_lang(reader, "");
      while (reader.read()) {
        switch (reader.node_type()) {
          case xml_node_type::end_element:
            return g;
          case xml_node_type::start_element:
            parse_node_element(reader, g, lang);
            break;
          case xml_node_type::characters:
            if (!is_whitespace(reader.text())) {
              error(reader, "unexpected text inside rdf:RDF");
            }
            break;
        }
      }
      error(reader, "unexpected end of document");
    }
    return g;
  }

  term
  rdfxml_reader::parse_node_element(xml_reader& reader, graph& g,
                                    const std::string& inherited_lang) {
    std::string lang = element_lang(reader, inherited_lang);

    term subject;
    if (auto about = reader.find_attribute(rdf_about)) {
      subject = iri(std::string(*about));
    } else if (auto node_id = reader.find_attribute(rdf_nodeID)) {
      subject = blank_node(std::string(*node_id));
    } else if (reader.find_attribute(rdf_ID)) {
      error(reader, "rdf:ID is not supported");
    } else {
      subject = fresh_blank_node();
    }

    if (reader.name() != rdf_Description) {
      g.add(subject, rdf::type, iri(reader.name().to_iri()));
    }
    add_property_attributes(reader, g, subject, lang);

    parse_property_elements(reader, g, subject, lang);
    return subject;
  }

  void
  rdfxml_reader::parse_property_elements(xml_reader& reader, graph& g,
                                         const term& subject,
                                         const std::string& lang) {
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::end_element:
          return;
        case xml_node_type::start_element:
          parse_property_element(reader, g, subject, lang);
          break;
        case xml_node_type::characters:
          if (!is_whitespace(reader.text())) {
            error(reader, "unexpected text between property elements");
          }
          break;
      }
    }
    error(reader, "unexpected end of document");
  }

  void
  rdfxml_reader::parse_property_element(xml_reader& reader, graph& g,
                                        const term& subject,
                                        const std::string& inherited_lang) {
    iri predicate(reader.name().to_iri());
    std::string lang = element_lang(reader, inherited_lang);

    if (auto parse_type = reader.find_attribute(rdf_parseType)) {
      if (*parse_type != "Resource") {
        error(reader, "unsupported rdf:parseType \"" +
                          std::string(*parse_type) + "\"");
      }
      auto object = fresh_blank_node();
      g.add(subject, predicate, object);
      parse_property_elements(reader, g, object, lang);
      return;
    }

    auto resource = reader.find_attribute(rdf_resource);
    auto node_id = reader.find_attribute(rdf_nodeID);
    if (resource || node_id) {
      term object;
      if (resource) {
        object = iri(std::string(*resource));
      } else {
        object = blank_node(std::string(*node_id));
      }
      g.add(subject, predicate, object);
      add_property_attributes(reader, g, object, lang);
      skip_empty_element(reader);
      return;
    }

    std::optional<iri> datatype;
    if (auto dt = reader.find_attribute(rdf_datatype)) {
      datatype = iri(std::string(*dt));
    }

    // An empty property element with property attributes describes a blank
    // node; the attributes are read before the cursor moves on.
    std::optional<blank_node> attribute_node;
    if (has_property_attributes(reader)) {
      attribute_node = fresh_blank_node();
      add_property_attributes(reader, g, *attribute_node, lang);
    }

    std::string text;
    std::optional<term> nested;
    while (reader.read()) {
      auto type = reader.node_type();
      if (type == xml_node_type::end_element) break;
      if (type == xml_node_type::characters) {
        text += reader.text();
        continue;
      }
      if (nested) { error(reader, "more than one node in property element"); }
      nested = parse_node_element(reader, g, lang);
    }

    if (nested) {
      if (!is_whitespace(text)) {
        error(reader, "property element mixes text and a node element");
      }
      g.add(subject, predicate, *nested);
    } else if (attribute_node) {
      if (!text.empty()) {
        error(reader, "property element with property attributes has text");
      }
      g.add(subject, predicate, *attribute_node);
    } else if (datatype) {
      g.add(subject, predicate, literal(std::move(text), *datatype));
    } else {
      g.add(subject, predicate, make_literal(std::move(text), lang));
    }
  }

  graph
  parse_rdfxml(std::string_view xml) {
    expat_reader reader(xml);
    rdfxml_reader rdf;
    return rdf.parse(reader);
  }

} // namespace shx
