#include <shx/ostream_writer.hpp>

#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shx {

  namespace {

    // XML 1.0 admits no C0 control character except TAB, LF and CR, not
    // even as a character reference.
    [[noreturn]] void
    unrepresentable(char c) {
      char code[8];
      std::snprintf(code, sizeof(code), "U+%04X",
                    static_cast<unsigned>(static_cast<unsigned char>(c)));
      throw std::runtime_error(std::string("xml writer: control character ") +
                               code + " cannot be written in XML 1.0");
    }

    // Carriage returns become character references in both contexts, since a
    // parser normalizes "\r\n" to "\n". Attribute values also protect the
    // whitespace that attribute value normalization would fold to spaces.
    void
    write_escaped(std::ostream& os, std::string_view text, bool attribute) {
      for (char c : text) {
        if (static_cast<unsigned char>(c) < 0x20 && c != '\t' && c != '\n' &&
            c != '\r') {
          unrepresentable(c);
        }
        switch (c) {
          case '<':
            os << "&lt;";
            break;
          case '>':
            os << "&gt;";
            break;
          case '&':
            os << "&amp;";
            break;
          case '\r':
            os << "&#13;";
            break;
          case '"':
            if (attribute) {
              os << "&quot;";
            } else {
              os << c;
            }
            break;
          case '\n':
            if (attribute) {
              os << "&#10;";
            } else {
              os << c;
            }
            break;
          case '\t':
            if (attribute) {
              os << "&#9;";
            } else {
              os << c;
            }
            break;
          default:
            os << c;
            break;
        }
      }
    }

  } // namespace

  struct ostream_writer::impl {
    std::ostream& os;
    bool indent;
    bool wrote_any = false;

    // Namespace URI -> prefix mapping
    std::unordered_map<std::string, std::string> ns_prefixes;

    // start_element() buffers its name; namespace_declaration() and
    // attribute() accumulate onto the buffer. The tag is written when child
    // content arrives or end_element() is called.
    bool tag_pending = false;
    qname pending_name;

    struct pending_attr {
      qname name;
      std::string value;
    };

    std::vector<pending_attr> pending_attrs;

    struct pending_ns {
      std::string prefix;
      std::string uri;
    };

    std::vector<pending_ns> pending_ns_decls;

    struct element_frame {
      qname name;
      bool has_text = false;
      bool has_children = false;
      // Undo log for namespace bindings declared on this element.
      // Each entry: (uri, previous prefix or nullopt if uri was unbound).
      std::vector<std::pair<std::string, std::optional<std::string>>> ns_undo;
    };

    std::vector<element_frame> stack;

    impl(std::ostream& os, bool indent) : os(os), indent(indent) {
      // The xml prefix is bound without a declaration.
      ns_prefixes["http://www.w3.org/XML/1998/namespace"] = "xml";
    }

    void
    write_prefixed_name(const qname& name) {
      if (!name.namespace_uri().empty()) {
        auto it = ns_prefixes.find(name.namespace_uri());
        if (it != ns_prefixes.end() && !it->second.empty()) {
          os << it->second << ':';
        }
      }
      os << name.local_name();
    }

    void
    write_line_break(std::size_t level) {
      os << '\n';
      for (std::size_t i = 0; i < level; ++i) {
        os << "  ";
      }
    }

    void
    flush_pending_tag() {
      if (!tag_pending) { return; }
      tag_pending = false;

      os << '<';
      write_prefixed_name(pending_name);

      for (const auto& ns : pending_ns_decls) {
        if (ns.prefix.empty()) {
          os << " xmlns=\"";
        } else {
          os << " xmlns:" << ns.prefix << "=\"";
        }
        write_escaped(os, ns.uri, true);
        os << '"';
      }

      for (const auto& attr : pending_attrs) {
        os << ' ';
        write_prefixed_name(attr.name);
        os << "=\"";
        write_escaped(os, attr.value, true);
        os << '"';
      }

      pending_ns_decls.clear();
      pending_attrs.clear();
    }

    // Ensure the most recent open tag is flushed and closed with '>'.
    void
    flush_and_close_tag() {
      if (tag_pending) {
        flush_pending_tag();
        os << '>';
      }
    }
  };

  ostream_writer::ostream_writer(std::ostream& os, bool indent)
      : impl_(std::make_unique<impl>(os, indent)) {}

  ostream_writer::~ostream_writer() = default;

  void
  ostream_writer::start_element(const qname& name) {
    impl_->flush_and_close_tag();

    bool break_line = impl_->wrote_any;
    if (!impl_->stack.empty()) {
      auto& parent = impl_->stack.back();
      parent.has_children = true;
      break_line = !parent.has_text;
    }
    if (impl_->indent && break_line) {
      impl_->write_line_break(impl_->stack.size());
    }

    impl_->stack.push_back({name, false, false, {}});
    impl_->tag_pending = true;
    impl_->pending_name = name;
    impl_->wrote_any = true;
  }

  void
  ostream_writer::end_element() {
    auto frame = std::move(impl_->stack.back());
    impl_->stack.pop_back();

    if (impl_->tag_pending) {
      impl_->flush_pending_tag();
      impl_->os << "/>";
    } else {
      if (impl_->indent && frame.has_children && !frame.has_text) {
        impl_->write_line_break(impl_->stack.size());
      }
      impl_->os << "</";
      impl_->write_prefixed_name(frame.name);
      impl_->os << '>';
    }

    for (auto& [uri, prev] : frame.ns_undo) {
      if (prev.has_value()) {
        impl_->ns_prefixes[uri] = std::move(*prev);
      } else {
        impl_->ns_prefixes.erase(uri);
      }
    }
  }

  void
  ostream_writer::attribute(const qname& name, std::string_view value) {
    impl_->pending_attrs.push_back({name, std::string(value)});
  }

  void
  ostream_writer::characters(std::string_view text) {
    impl_->flush_and_close_tag();
    if (!impl_->stack.empty()) { impl_->stack.back().has_text = true; }
    write_escaped(impl_->os, text, false);
  }

  void
  ostream_writer::namespace_declaration(std::string_view prefix,
                                        std::string_view uri) {
    std::string uri_str(uri);

    auto it = impl_->ns_prefixes.find(uri_str);
    std::optional<std::string> prev = it != impl_->ns_prefixes.end()
                                          ? std::optional(it->second)
                                          : std::nullopt;
    impl_->stack.back().ns_undo.emplace_back(uri_str, std::move(prev));

    impl_->ns_prefixes[uri_str] = std::string(prefix);

    impl_->pending_ns_decls.push_back(
        {std::string(prefix), std::move(uri_str)});
  }

} // namespace shx
