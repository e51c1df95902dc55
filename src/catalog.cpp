#include "elfpeek/catalog.hpp"

#include <algorithm>
#include <array>
#include <elf.h>
#include <utility>

namespace elfpeek {
namespace {

template <typename Key, size_t N>
using table = std::array<std::pair<Key, std::string_view>, N>;

template <typename Key, size_t N>
constexpr const std::string_view *find(table<Key, N> const &t,
                                       Key key) noexcept {
  auto it = std::ranges::find(t, key, &std::pair<Key, std::string_view>::first);
  return it == t.end() ? nullptr : &it->second;
}

constexpr auto machine_names = std::to_array<
    std::pair<machine_type, std::string_view>>({{none_m, "None"},
                                                {att, "AT&T WE 32100"},
                                                {sparc, "SPARC"},
                                                {x86, "x86"},
                                                {m68k, "Motorola 68000"},
                                                {mips, "MIPS"},
                                                {sparc32plus, "SPARC 32+"},
                                                {ppc, "PowerPC"},
                                                {ppc64, "PowerPC64"},
                                                {s390, "S/390"},
                                                {arm, "ARM"},
                                                {superh, "SuperH"},
                                                {sparcv9, "SPARC V9"},
                                                {ia64, "IA-64"},
                                                {amd64, "AMD64"},
                                                {avr, "AVR"},
                                                {xtensa, "Xtensa"},
                                                {aarch64, "AArch64"},
                                                {cuda, "CUDA"},
                                                {amd_gpu, "AMD GPU"},
                                                {riscv, "RISC-V"},
                                                {bpf, "BPF"},
                                                {loongarch, "LoongArch"}});

constexpr auto os_abi_names = std::to_array<std::pair<u8, std::string_view>>(
    {{ELFOSABI_SYSV, "UNIX - System V"},
     {ELFOSABI_HPUX, "HP-UX"},
     {ELFOSABI_NETBSD, "NetBSD"},
     {ELFOSABI_GNU, "GNU/Linux"},
     {ELFOSABI_SOLARIS, "Solaris"},
     {ELFOSABI_AIX, "AIX"},
     {ELFOSABI_IRIX, "IRIX"},
     {ELFOSABI_FREEBSD, "FreeBSD"},
     {ELFOSABI_TRU64, "TRU64 UNIX"},
     {ELFOSABI_MODESTO, "Novell Modesto"},
     {ELFOSABI_OPENBSD, "OpenBSD"},
     {ELFOSABI_ARM_AEABI, "ARM EABI"},
     {ELFOSABI_ARM, "ARM"},
     {ELFOSABI_STANDALONE, "Standalone"}});

} // namespace

elf_class classify_class(u8 code) noexcept {
  switch (code) {
  case ELFCLASS32:
    return e32;
  case ELFCLASS64:
    return e64;
  default:
    return class_none;
  }
}

endianess classify_data_encoding(u8 code) noexcept {
  switch (code) {
  case ELFDATA2LSB:
    return little;
  case ELFDATA2MSB:
    return big;
  default:
    return data_none;
  }
}

file_type classify_object_type(u16 code) noexcept {
  switch (code) {
  case ET_NONE:
    return none_f;
  case ET_REL:
    return rel;
  case ET_EXEC:
    return exec;
  case ET_DYN:
    return dyn;
  case ET_CORE:
    return core;
  case ET_LOOS:
  case ET_HIOS:
    return os_specific;
  case ET_LOPROC:
  case ET_HIPROC:
    return proc_specific;
  default:
    return invalid_f;
  }
}

std::optional<machine_type> classify_machine(u16 code) noexcept {
  auto m = static_cast<machine_type>(code);
  if (!find(machine_names, m))
    return std::nullopt;
  return m;
}

std::string_view format_as(elf_class e) noexcept {
  switch (e) {
  case e32:
    return "32bit architecture";
  case e64:
    return "64bit architecture";
  default:
    return "Invalid class";
  }
}

std::string_view format_as(endianess e) noexcept {
  switch (e) {
  case little:
    return "Little endian";
  case big:
    return "Big endian";
  default:
    return "Invalid data";
  }
}

std::string_view format_as(file_type e) noexcept {
  switch (e) {
  case none_f:
    return "No file type";
  case rel:
    return "Relocatable file";
  case exec:
    return "Executable file";
  case dyn:
    return "Shared object file";
  case core:
    return "Core file";
  case os_specific:
    return "Operating system-specific";
  case proc_specific:
    return "Processor-specific";
  default:
    return "Invalid type";
  }
}

std::string_view format_as(machine_type e) noexcept {
  if (auto name = find(machine_names, e))
    return *name;
  return "???";
}

std::string_view lookup_class(u8 code) noexcept {
  return format_as(classify_class(code));
}

std::string_view lookup_data_encoding(u8 code) noexcept {
  return format_as(classify_data_encoding(code));
}

std::string_view lookup_object_type(u16 code) noexcept {
  return format_as(classify_object_type(code));
}

std::string_view lookup_os_abi(u8 code) noexcept {
  if (auto name = find(os_abi_names, code))
    return *name;
  return "Unknown ABI";
}

std::optional<std::string_view> lookup_machine(u16 code) noexcept {
  auto m = classify_machine(code);
  if (!m)
    return std::nullopt;
  return format_as(*m);
}

} // namespace elfpeek
