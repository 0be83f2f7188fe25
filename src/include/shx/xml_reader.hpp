#pragma once

#include <shx/qname.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace shx {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull-style cursor over the events of one XML document.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const qname&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const qname&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    // Value of the named attribute, or nullopt when the element lacks it.
    virtual std::optional<std::string_view>
    find_attribute(const qname& name) const = 0;

    virtual std::string_view
    text() const = 0;

    // Source line of the current event, for error messages.
    virtual std::size_t
    line() const = 0;
  };

} // namespace shx
