#include "elfpeek/layout.hpp"
#include "elfpeek/report.hpp"
#include "io.hpp"
#include <cstdio>
#include <fmt/core.h>
#include <range/v3/range/conversion.hpp>
#include <ranges>
#include <span>
#include <string>
#include <sysexits.h>
#include <vector>

int main(int argc, char **argv) {
  if (argc < 2) {
    fmt::print(stderr, "usage: {} FILE...\n", argv[0]);
    return EX_USAGE;
  }

  auto paths =
      std::span(argv + 1, static_cast<size_t>(argc - 1)) |
      std::views::transform([](char *arg) { return std::string(arg); }) |
      ranges::to<std::vector>;

  auto outcomes = elfpeek::inspect_all(paths, [](std::string const &path) {
    return read_file(path, elfpeek::layout::layout64::size);
  });
  elfpeek::render(stdout, outcomes);

  for (auto const &outcome : outcomes) {
    auto e = outcome.error();
    if (e && e->kind != elfpeek::failure::not_elf)
      fmt::print(stderr, "elfpeek: {}: {}\n", outcome.path, e->message);
  }
  return elfpeek::exit_status(outcomes);
}
