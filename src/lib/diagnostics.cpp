#include <shx/diagnostics.hpp>

#include <iostream>

namespace shx {

  void
  default_warning(const std::string& message) {
    std::cerr << "shx: warning: " << message << "\n";
  }

  void
  warn(const warning_fn& sink, const std::string& message) {
    if (sink) {
      sink(message);
    } else {
      default_warning(message);
    }
  }

} // namespace shx
