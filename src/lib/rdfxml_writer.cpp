#include <shx/rdfxml_writer.hpp>

#include <shx/ostream_writer.hpp>
#include <shx/vocabulary.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace shx {

  namespace {

    const qname rdf_RDF{rdf::ns, "RDF"};
    const qname rdf_Description{rdf::ns, "Description"};
    const qname rdf_about{rdf::ns, "about"};
    const qname rdf_nodeID{rdf::ns, "nodeID"};
    const qname rdf_resource{rdf::ns, "resource"};
    const qname rdf_datatype{rdf::ns, "datatype"};
    const qname xml_lang{xml::ns, "lang"};

    qname
    predicate_name(const iri& predicate) {
      auto name = qname::split_iri(predicate.value());
      if (!name) {
        throw std::runtime_error(
            "rdfxml_writer: predicate cannot be written as an element name: " +
            predicate.value());
      }
      return *name;
    }

    // An IRI goes in `name` (rdf:about or rdf:resource); a blank node always
    // goes in rdf:nodeID.
    void
    write_node_reference(xml_writer& writer, const qname& name,
                         const term& t) {
      if (auto* i = std::get_if<iri>(&t)) {
        writer.attribute(name, i->value());
      } else {
        writer.attribute(rdf_nodeID, std::get<blank_node>(t).id());
      }
    }

  } // namespace

  rdfxml_writer::rdfxml_writer() {
    add_prefix("rdf", rdf::ns);
    add_prefix("rdfs", rdfs::ns);
    add_prefix("xsd", xsd::ns);
    add_prefix("sh", sh::ns);
  }

  void
  rdfxml_writer::add_prefix(std::string prefix, std::string namespace_uri) {
    prefixes_.emplace_back(std::move(prefix), std::move(namespace_uri));
  }

  void
  rdfxml_writer::write(const graph& g, xml_writer& writer) const {
    // Group triples by subject, keeping first-seen order.
    std::vector<term> subjects;
    std::unordered_map<term, std::vector<const triple*>> by_subject;
    std::vector<std::string> namespaces{rdf::ns};
    for (const auto& t : g.triples()) {
      auto [it, inserted] = by_subject.try_emplace(t.subject);
      if (inserted) subjects.push_back(t.subject);
      it->second.push_back(&t);

      auto ns = predicate_name(t.predicate).namespace_uri();
      if (std::find(namespaces.begin(), namespaces.end(), ns) ==
          namespaces.end()) {
        namespaces.push_back(std::move(ns));
      }
    }

    writer.start_element(rdf_RDF);

    std::size_t generated = 0;
    for (const auto& ns : namespaces) {
      std::string prefix;
      for (const auto& [p, uri] : prefixes_) {
        if (uri == ns) {
          prefix = p;
          break;
        }
      }
      if (prefix.empty()) { prefix = "ns" + std::to_string(generated++); }
      writer.namespace_declaration(prefix, ns);
    }

    for (const auto& subject : subjects) {
      writer.start_element(rdf_Description);
      write_node_reference(writer, rdf_about, subject);

      for (const auto* t : by_subject[subject]) {
        writer.start_element(predicate_name(t->predicate));
        if (auto* l = std::get_if<literal>(&t->object)) {
          if (l->has_language()) {
            writer.attribute(xml_lang, *l->language());
          } else if (l->datatype() != xsd::string) {
            writer.attribute(rdf_datatype, l->datatype().value());
          }
          writer.characters(l->lexical());
        } else {
          write_node_reference(writer, rdf_resource, t->object);
        }
        writer.end_element();
      }

      writer.end_element();
    }

    writer.end_element();
  }

  std::string
  to_rdfxml(const graph& g) {
    std::ostringstream os;
    os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    ostream_writer writer(os, true);
    rdfxml_writer{}.write(g, writer);
    os << '\n';
    return os.str();
  }

} // namespace shx
