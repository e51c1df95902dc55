#pragma once

#include <concepts>
#include <fmt/format.h>
#include <stdexcept>
#include <type_traits>
#include <utility>

template <std::integral To, std::integral From>
inline constexpr To cast(From i)
  requires(!std::is_same_v<To, From>)
{
  if (!std::in_range<To>(i)) {
    throw std::runtime_error(
        fmt::format("Cast of {} from integral of size {} to {} failed", i,
                    sizeof(From), sizeof(To)));
  }
  return static_cast<To>(i);
}

template <typename Id> inline constexpr Id cast(Id i) { return i; }
