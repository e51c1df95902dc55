#pragma once

#include "elfpeek/types.hpp"
#include <concepts>
#include <cstddef>
#include <elf.h>
#include <string_view>

namespace elfpeek {
namespace layout {

template <std::unsigned_integral T> struct field {
  using type = T;
  std::string_view name;
  size_t offset;
  constexpr size_t width() const noexcept { return sizeof(T); }
  constexpr size_t end() const noexcept { return offset + sizeof(T); }
};

// A field that starts where prev ends.
template <std::unsigned_integral T, std::unsigned_integral Prev>
constexpr field<T> after(field<Prev> prev, std::string_view name) noexcept {
  return {name, prev.end()};
}

namespace ident {
constexpr field<u8> format{"EI_CLASS", EI_CLASS};
constexpr auto data = after<u8>(format, "EI_DATA");
constexpr auto version = after<u8>(data, "EI_VERSION");
constexpr auto os_abi = after<u8>(version, "EI_OSABI");
constexpr auto abi_version = after<u8>(os_abi, "EI_ABIVERSION");
static_assert(format.offset == SELFMAG);
static_assert(abi_version.end() == EI_PAD);
} // namespace ident

// Addr is the width of e_entry, e_phoff and e_shoff: u32 for ELF32, u64 for
// ELF64. Everything else has the same width in both classes.
template <std::unsigned_integral Addr> struct header_layout {
  static constexpr field<u16> type{"e_type", EI_NIDENT};
  static constexpr auto machine = after<u16>(type, "e_machine");
  static constexpr auto version = after<u32>(machine, "e_version");
  static constexpr auto entry = after<Addr>(version, "e_entry");
  static constexpr auto phoff = after<Addr>(entry, "e_phoff");
  static constexpr auto shoff = after<Addr>(phoff, "e_shoff");
  static constexpr auto flags = after<u32>(shoff, "e_flags");
  static constexpr auto ehsize = after<u16>(flags, "e_ehsize");
  static constexpr auto phentsize = after<u16>(ehsize, "e_phentsize");
  static constexpr auto phnum = after<u16>(phentsize, "e_phnum");
  static constexpr auto shentsize = after<u16>(phnum, "e_shentsize");
  static constexpr auto shnum = after<u16>(shentsize, "e_shnum");
  static constexpr auto shstrndx = after<u16>(shnum, "e_shstrndx");
  static constexpr size_t size = shstrndx.end();
};

using layout32 = header_layout<u32>;
using layout64 = header_layout<u64>;

static_assert(layout32::size == sizeof(Elf32_Ehdr));
static_assert(layout64::size == sizeof(Elf64_Ehdr));
static_assert(layout32::entry.offset == offsetof(Elf32_Ehdr, e_entry));
static_assert(layout64::entry.offset == offsetof(Elf64_Ehdr, e_entry));
static_assert(layout32::flags.offset == offsetof(Elf32_Ehdr, e_flags));
static_assert(layout64::flags.offset == offsetof(Elf64_Ehdr, e_flags));
static_assert(layout64::shstrndx.offset == offsetof(Elf64_Ehdr, e_shstrndx));

// ELFCLASS32 selects the 32-bit layout, every other class the 64-bit one.
constexpr size_t size_of(elf_class format) noexcept {
  return format == e32 ? layout32::size : layout64::size;
}

} // namespace layout
} // namespace elfpeek
