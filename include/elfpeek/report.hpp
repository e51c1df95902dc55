#pragma once

#include "elfpeek/types.hpp"
#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace elfpeek {

enum class failure { not_elf, truncated, unreadable };

struct inspect_error {
  failure kind;
  std::string message;
};

struct file_outcome {
  std::string path;
  std::variant<header, inspect_error> result;

  header const *decoded() const noexcept {
    return std::get_if<header>(&result);
  }
  inspect_error const *error() const noexcept {
    return std::get_if<inspect_error>(&result);
  }
};

// Turns a path into the bytes of the file, throwing io_error on failure.
using loader = std::function<std::vector<uint8_t>(std::string const &)>;

file_outcome inspect(std::string path, loader const &load);

// Every path is attempted, in order, whatever happens to the others.
std::vector<file_outcome> inspect_all(std::span<const std::string> paths,
                                      loader const &load);

enum class style { label, decimal, hex, bytes };

using value = std::variant<u64, std::string_view>;

struct row {
  std::string_view label;
  style display;
  // One slot per decoded file; empty when the field is absent for that file.
  std::vector<std::optional<value>> cells;
};

struct result_table {
  std::vector<std::string_view> files;
  std::vector<row> rows;

  row const &at(std::string_view label) const;
};

// Builds the table from the decoded outcomes, skipping failed ones. The table
// refers to the outcomes' paths, so they must outlive it.
result_table tabulate(std::span<const file_outcome> outcomes);

std::string format_cell(style display, value const &v);
std::string render_to_string(std::span<const file_outcome> outcomes);
void render(std::FILE *out, std::span<const file_outcome> outcomes);

// EX_NOINPUT if any file was unreadable, otherwise EX_DATAERR if any was
// truncated, otherwise EXIT_SUCCESS. Rejected non-ELF files do not count.
int exit_status(std::span<const file_outcome> outcomes) noexcept;

} // namespace elfpeek
