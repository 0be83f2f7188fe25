#pragma once

#include <shx/graph.hpp>
#include <shx/report.hpp>

#include <stdexcept>
#include <string_view>

namespace shx {

  class report_parse_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Reads a SHACL validation report back into a report. The report node is
  // the subject of sh:conforms; its value must be a literal spelled "true"
  // or "false" (or an xsd:boolean "1" or "0"). Every result needs an
  // sh:focusNode. Results are bucketed by sh:resultSeverity, with unknown or
  // missing severities read as violations.
  class report_parser {
  public:
    report
    parse(std::string_view rdfxml) const;

    report
    parse(const graph& g) const;
  };

} // namespace shx
