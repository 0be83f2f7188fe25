#pragma once

#include <compare>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace shx {

  // Expanded XML name. RDF/XML spells every predicate and typed node as an
  // element name, so a qname is also the split form of an IRI: the IRI is
  // namespace_uri() + local_name().
  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    std::string
    to_iri() const {
      return namespace_uri_ + local_name_;
    }

    // Split an IRI into the longest trailing NCName and the namespace before
    // it. Returns nullopt when the IRI does not end in an NCName (for example
    // "http://example.org/123" or "urn:x#").
    static std::optional<qname>
    split_iri(std::string_view iri);

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      if (q.namespace_uri_.empty()) { return os << q.local_name_; }
      return os << '{' << q.namespace_uri_ << '}' << q.local_name_;
    }
  };

} // namespace shx

template <>
struct std::hash<shx::qname> {
  std::size_t
  operator()(const shx::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
