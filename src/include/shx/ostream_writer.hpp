#pragma once

#include <shx/xml_writer.hpp>

#include <memory>
#include <ostream>

namespace shx {

  class ostream_writer : public xml_writer {
  public:
    // With indent set, every element that starts a line is placed on its own
    // line, two spaces per nesting level. Elements holding text are never
    // broken up, so literal values are written byte for byte.
    explicit ostream_writer(std::ostream& os, bool indent = false);
    ~ostream_writer() override;

    ostream_writer(const ostream_writer&) = delete;
    ostream_writer&
    operator=(const ostream_writer&) = delete;

    void
    start_element(const qname& name) override;

    void
    end_element() override;

    void
    attribute(const qname& name, std::string_view value) override;

    void
    characters(std::string_view text) override;

    void
    namespace_declaration(std::string_view prefix,
                          std::string_view uri) override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace shx
