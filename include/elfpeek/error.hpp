#pragma once

#include <stdexcept>
#include <string>

namespace elfpeek {

enum class decode_errc { not_recognized_format, truncated };

struct decode_error : std::runtime_error {
  decode_error(decode_errc code, std::string const &what)
      : std::runtime_error(what), code(code) {}
  decode_errc code;
};

// Thrown by file loaders when a path cannot be turned into a buffer.
struct io_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace elfpeek
