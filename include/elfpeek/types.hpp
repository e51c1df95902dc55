#pragma once

#include <cstdint>
#include <elf.h>
#include <optional>

namespace elfpeek {

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

enum elf_class : u8 {
  class_none = ELFCLASSNONE,
  e32 = ELFCLASS32,
  e64 = ELFCLASS64
};

enum endianess : u8 {
  data_none = ELFDATANONE,
  little = ELFDATA2LSB,
  big = ELFDATA2MSB
};

// os_specific covers ET_LOOS..ET_HIOS, proc_specific ET_LOPROC..ET_HIPROC.
enum file_type : u8 {
  none_f,
  rel,
  exec,
  dyn,
  core,
  os_specific,
  proc_specific,
  invalid_f
};

// Only the architectures the catalog knows about. Anything else decodes to an
// empty std::optional<machine_type>.
enum machine_type : u16 {
  none_m = EM_NONE,
  att = EM_M32,
  sparc = EM_SPARC,
  x86 = EM_386,
  m68k = EM_68K,
  mips = EM_MIPS,
  sparc32plus = EM_SPARC32PLUS,
  ppc = EM_PPC,
  ppc64 = EM_PPC64,
  s390 = EM_S390,
  arm = EM_ARM,
  superh = EM_SH,
  sparcv9 = EM_SPARCV9,
  ia64 = EM_IA_64,
  amd64 = EM_X86_64,
  avr = EM_AVR,
  xtensa = EM_XTENSA,
  aarch64 = EM_AARCH64,
  cuda = EM_CUDA,
  amd_gpu = EM_AMDGPU,
  riscv = EM_RISCV,
  bpf = EM_BPF,
  loongarch = EM_LOONGARCH
};

struct header {
  elf_class format = e64;
  endianess endian = little;
  u8 ei_version = EV_CURRENT;
  u8 os_abi = ELFOSABI_NONE;
  u8 abi_version = 0;
  file_type type = none_f;
  u16 type_code = ET_NONE;
  std::optional<machine_type> machine = none_m;
  u16 machine_code = EM_NONE;
  u32 e_version = EV_CURRENT;
  u64 entry_point = 0;
  u64 program_offset = 0;
  u64 section_offset = 0;
  u32 flags = 0;
  u16 header_size = 0;
  u16 ph_size = 0;
  u16 ph_num = 0;
  u16 sh_size = 0;
  u16 sh_num = 0;
  u16 section_str_index = 0;
  bool operator==(header const &o) const noexcept = default;
};

} // namespace elfpeek
