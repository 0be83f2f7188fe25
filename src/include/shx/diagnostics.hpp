#pragma once

#include <functional>
#include <string>

namespace shx {

  // Receives non-fatal diagnostics, such as a query constraint that failed
  // and was skipped.
  using warning_fn = std::function<void(const std::string& message)>;

  // Writes "shx: warning: <message>" to std::cerr.
  void
  default_warning(const std::string& message);

  // Sends `message` to `sink`, or to default_warning when `sink` is empty.
  void
  warn(const warning_fn& sink, const std::string& message);

} // namespace shx
