#pragma once

#include "elfpeek/error.hpp"
#include "elfpeek/types.hpp"
#include <array>
#include <cstdint>
#include <elf.h>
#include <span>
#include <vector>

namespace elfpeek {

constexpr std::array<u8, SELFMAG> magic = {ELFMAG0, ELFMAG1, ELFMAG2, ELFMAG3};

bool has_signature(std::span<const uint8_t> buffer) noexcept;

// Decodes the leading ELF header of buffer. Multi-byte fields are read in the
// byte order declared by EI_DATA, with the 32-bit layout for ELFCLASS32 and
// the 64-bit layout otherwise. Throws decode_error.
header decode(std::span<const uint8_t> buffer);

// Inverse of decode: serializes h using its own class and byte order.
std::vector<uint8_t> encode(header const &h);

} // namespace elfpeek
