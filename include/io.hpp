#pragma once

#include "elfpeek/error.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fmt/core.h>
#include <limits>
#include <scope_guard.hpp>
#include <string>
#include <string_view>
#include <vector>

// Reads at most limit bytes from the start of path.
inline std::vector<uint8_t>
read_file(std::string const &path,
          size_t limit = std::numeric_limits<size_t>::max()) {
  auto fail = [&](std::string_view what) {
    return elfpeek::io_error(
        fmt::format("failed to {} {}: {}", what, path, std::strerror(errno)));
  };

  auto f = std::fopen(path.c_str(), "rb");
  if (!f)
    throw fail("open");
  auto guard = sg::make_scope_guard([&]() noexcept { std::fclose(f); });

  if (std::fseek(f, 0, SEEK_END))
    throw fail("fseek");
  auto size = std::ftell(f);
  if (size < 0)
    throw fail("ftell");
  if (std::fseek(f, 0, SEEK_SET))
    throw fail("fseek");

  std::vector<uint8_t> result;
  result.resize(std::min(static_cast<size_t>(size), limit));
  auto n = std::fread(result.data(), 1, result.size(), f);
  if (std::ferror(f))
    throw fail("read");
  result.resize(n);
  return result;
}
