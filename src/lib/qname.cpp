#include <shx/qname.hpp>

#include <cctype>

namespace shx {

  namespace {

    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences; XML allows most
    // non-ASCII characters in names, so they are accepted wholesale.
    bool
    is_ncname_start(char c) {
      auto u = static_cast<unsigned char>(c);
      return std::isalpha(u) || c == '_' || u >= 0x80;
    }

    bool
    is_ncname_char(char c) {
      auto u = static_cast<unsigned char>(c);
      return std::isalnum(u) || c == '_' || c == '-' || c == '.' || u >= 0x80;
    }

  } // namespace

  std::optional<qname>
  qname::split_iri(std::string_view iri) {
    std::size_t start = iri.size();
    while (start > 0 && is_ncname_char(iri[start - 1])) {
      --start;
    }
    while (start < iri.size() && !is_ncname_start(iri[start])) {
      ++start;
    }
    if (start >= iri.size() || start == 0) { return std::nullopt; }
    return qname{std::string(iri.substr(0, start)),
                 std::string(iri.substr(start))};
  }

} // namespace shx
