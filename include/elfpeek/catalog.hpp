#pragma once

#include "elfpeek/types.hpp"
#include <optional>
#include <string_view>

namespace elfpeek {

// Total lookups: unknown codes resolve to an "Invalid ..." label.
std::string_view lookup_class(u8 code) noexcept;
std::string_view lookup_data_encoding(u8 code) noexcept;
std::string_view lookup_object_type(u16 code) noexcept;
std::string_view lookup_os_abi(u8 code) noexcept;

// Partial: the machine table only covers a subset of the registered EM_*
// values, so unknown codes yield std::nullopt instead of a label.
std::optional<std::string_view> lookup_machine(u16 code) noexcept;

elf_class classify_class(u8 code) noexcept;
endianess classify_data_encoding(u8 code) noexcept;
file_type classify_object_type(u16 code) noexcept;
std::optional<machine_type> classify_machine(u16 code) noexcept;

std::string_view format_as(elf_class e) noexcept;
std::string_view format_as(endianess e) noexcept;
std::string_view format_as(file_type e) noexcept;
std::string_view format_as(machine_type e) noexcept;

} // namespace elfpeek
