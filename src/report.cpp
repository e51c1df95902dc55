#include "elfpeek/report.hpp"
#include "elfpeek/catalog.hpp"
#include "elfpeek/decode.hpp"
#include "elfpeek/error.hpp"

#include <array>
#include <cstdlib>
#include <fmt/core.h>
#include <fmt/format.h>
#include <iterator>
#include <stdexcept>
#include <sysexits.h>
#include <utility>

namespace elfpeek {
namespace {

using cell = std::optional<value>;

struct row_spec {
  std::string_view label;
  style display;
  cell (*extract)(header const &);
};

constexpr auto field_rows = std::to_array<row_spec>({
    {"Architecture", style::label,
     [](header const &h) -> cell { return format_as(h.format); }},
    {"Endian", style::label,
     [](header const &h) -> cell { return format_as(h.endian); }},
    {"ELF Header Version", style::decimal,
     [](header const &h) -> cell { return h.ei_version; }},
    {"OS ABI", style::label,
     [](header const &h) -> cell { return lookup_os_abi(h.os_abi); }},
    {"ABI Version", style::decimal,
     [](header const &h) -> cell { return h.abi_version; }},
    {"File Type", style::label,
     [](header const &h) -> cell { return format_as(h.type); }},
    {"Machine Type", style::label,
     [](header const &h) -> cell {
       if (!h.machine)
         return std::nullopt;
       return format_as(*h.machine);
     }},
    {"Object File Version", style::hex,
     [](header const &h) -> cell { return h.e_version; }},
    {"Entry Point", style::hex,
     [](header const &h) -> cell { return h.entry_point; }},
    {"Program Header Offset", style::hex,
     [](header const &h) -> cell { return h.program_offset; }},
    {"Section Header Offset", style::hex,
     [](header const &h) -> cell { return h.section_offset; }},
    {"Flags", style::decimal, [](header const &h) -> cell { return h.flags; }},
    {"Header's Size", style::bytes,
     [](header const &h) -> cell { return h.header_size; }},
    {"Per Program Header's Size", style::bytes,
     [](header const &h) -> cell { return h.ph_size; }},
    {"Program Header's Number", style::decimal,
     [](header const &h) -> cell { return h.ph_num; }},
    {"Per Section Header's Size", style::bytes,
     [](header const &h) -> cell { return h.sh_size; }},
    {"Section Header's Number", style::decimal,
     [](header const &h) -> cell { return h.sh_num; }},
    {"Entry Index", style::decimal,
     [](header const &h) -> cell { return h.section_str_index; }},
});

failure classify(decode_errc code) noexcept {
  switch (code) {
  case decode_errc::not_recognized_format:
    return failure::not_elf;
  case decode_errc::truncated:
    return failure::truncated;
  }
  return failure::truncated;
}

} // namespace

file_outcome inspect(std::string path, loader const &load) {
  try {
    auto h = decode(load(path));
    return {std::move(path), std::move(h)};
  } catch (decode_error const &e) {
    return {std::move(path), inspect_error{classify(e.code), e.what()}};
  } catch (io_error const &e) {
    return {std::move(path), inspect_error{failure::unreadable, e.what()}};
  }
}

std::vector<file_outcome> inspect_all(std::span<const std::string> paths,
                                      loader const &load) {
  std::vector<file_outcome> result;
  result.reserve(paths.size());
  for (auto const &path : paths) {
    result.push_back(inspect(path, load));
  }
  return result;
}

row const &result_table::at(std::string_view label) const {
  for (auto const &r : rows) {
    if (r.label == label)
      return r;
  }
  throw std::out_of_range(fmt::format("no row labelled \"{}\"", label));
}

result_table tabulate(std::span<const file_outcome> outcomes) {
  result_table table;
  table.rows.reserve(field_rows.size());
  for (auto const &field : field_rows) {
    table.rows.push_back({field.label, field.display, {}});
  }

  for (auto const &outcome : outcomes) {
    auto h = outcome.decoded();
    if (!h)
      continue;
    table.files.push_back(outcome.path);
    for (size_t i = 0; i < field_rows.size(); ++i) {
      table.rows[i].cells.push_back(field_rows[i].extract(*h));
    }
  }
  return table;
}

std::string format_cell(style display, value const &v) {
  if (auto label = std::get_if<std::string_view>(&v))
    return std::string(*label);
  auto n = std::get<u64>(v);
  switch (display) {
  case style::hex:
    return fmt::format("{:#x}", n);
  case style::bytes:
    return fmt::format("{} bytes", n);
  default:
    return fmt::format("{}", n);
  }
}

std::string render_to_string(std::span<const file_outcome> outcomes) {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  for (auto const &outcome : outcomes) {
    auto e = outcome.error();
    if (e && e->kind == failure::not_elf)
      fmt::format_to(it, "{} is not an ELF file\n", outcome.path);
  }

  auto table = tabulate(outcomes);
  if (table.files.empty())
    return fmt::to_string(out);

  fmt::format_to(it, "{:^53}", "File");
  for (auto file : table.files) {
    fmt::format_to(it, "{:^30}", file);
  }
  fmt::format_to(it, "\n");

  for (auto const &r : table.rows) {
    fmt::format_to(it, "{:<50} = ", r.label);
    for (auto const &c : r.cells) {
      fmt::format_to(it, "{:<30}", c ? format_cell(r.display, *c) : "");
    }
    fmt::format_to(it, "\n");
  }
  return fmt::to_string(out);
}

void render(std::FILE *out, std::span<const file_outcome> outcomes) {
  fmt::print(out, "{}", render_to_string(outcomes));
}

int exit_status(std::span<const file_outcome> outcomes) noexcept {
  int status = EXIT_SUCCESS;
  for (auto const &outcome : outcomes) {
    auto e = outcome.error();
    if (!e)
      continue;
    if (e->kind == failure::unreadable)
      return EX_NOINPUT;
    if (e->kind == failure::truncated)
      status = EX_DATAERR;
  }
  return status;
}

} // namespace elfpeek
