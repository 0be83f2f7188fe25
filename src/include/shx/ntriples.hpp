#pragma once

#include <shx/graph.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace shx {

  // Strict N-Triples reader backed by serd. Malformed input throws
  // std::runtime_error naming the offending line; triples read before the
  // error stay in the target graph.
  class ntriples_parser {
  public:
    graph
    parse(std::string_view source);

    void
    parse_into(std::string_view source, graph& into);
  };

  // Every code point is escapable in N-Triples, so any graph can be written.
  void
  write_ntriples(std::ostream& os, const graph& g);

  std::string
  to_ntriples(const graph& g);

} // namespace shx
