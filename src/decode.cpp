#include "elfpeek/decode.hpp"
#include "binary_parsing.hpp"
#include "elfpeek/catalog.hpp"
#include "elfpeek/layout.hpp"
#include <cast.hpp>

#include <algorithm>
#include <bit>
#include <fmt/format.h>
#include <stdexcept>
#include <type_traits>

namespace lay = elfpeek::layout;

namespace {
using namespace elfpeek;

std::endian byte_order(endianess e) noexcept {
  return e == big ? std::endian::big : std::endian::little;
}

template <std::unsigned_integral T>
T consume_field(Reader &r, lay::field<T> f) {
  try {
    r.seek(f.offset);
    return r.consume<T>();
  } catch (std::out_of_range const &) {
    throw decode_error(
        decode_errc::truncated,
        fmt::format("{} needs bytes [{}, {}) but the buffer has {}", f.name,
                    f.offset, f.end(), r.size()));
  }
}

template <std::unsigned_integral Addr> void read_body(Reader &r, header &h) {
  using L = lay::header_layout<Addr>;
  h.type_code = consume_field(r, L::type);
  h.type = classify_object_type(h.type_code);
  h.machine_code = consume_field(r, L::machine);
  h.machine = classify_machine(h.machine_code);
  h.e_version = consume_field(r, L::version);
  h.entry_point = consume_field(r, L::entry);
  h.program_offset = consume_field(r, L::phoff);
  h.section_offset = consume_field(r, L::shoff);
  h.flags = consume_field(r, L::flags);
  h.header_size = consume_field(r, L::ehsize);
  h.ph_size = consume_field(r, L::phentsize);
  h.ph_num = consume_field(r, L::phnum);
  h.sh_size = consume_field(r, L::shentsize);
  h.sh_num = consume_field(r, L::shnum);
  h.section_str_index = consume_field(r, L::shstrndx);
}

template <std::unsigned_integral T, typename W>
void put_field(W &w, lay::field<T> f, std::type_identity_t<T> value) {
  if (w.bytes_written != f.offset)
    throw std::logic_error(fmt::format("{} written at offset {} instead of {}",
                                       f.name, w.bytes_written, f.offset));
  w.write(value);
}

template <std::unsigned_integral Addr, typename W>
void write_body(W &w, header const &h) {
  using L = lay::header_layout<Addr>;
  put_field(w, L::type, h.type_code);
  put_field(w, L::machine, h.machine_code);
  put_field(w, L::version, h.e_version);
  put_field(w, L::entry, cast<Addr>(h.entry_point));
  put_field(w, L::phoff, cast<Addr>(h.program_offset));
  put_field(w, L::shoff, cast<Addr>(h.section_offset));
  put_field(w, L::flags, h.flags);
  put_field(w, L::ehsize, h.header_size);
  put_field(w, L::phentsize, h.ph_size);
  put_field(w, L::phnum, h.ph_num);
  put_field(w, L::shentsize, h.sh_size);
  put_field(w, L::shnum, h.sh_num);
  put_field(w, L::shstrndx, h.section_str_index);
}

} // namespace

bool elfpeek::has_signature(std::span<const uint8_t> buffer) noexcept {
  return buffer.size() >= magic.size() &&
         std::ranges::equal(buffer.first(magic.size()), magic);
}

elfpeek::header elfpeek::decode(std::span<const uint8_t> buffer) {
  if (!has_signature(buffer))
    throw decode_error(decode_errc::not_recognized_format,
                       "missing ELF signature");

  auto data = Reader(buffer);
  header h;
  h.format = classify_class(consume_field(data, lay::ident::format));
  h.endian = classify_data_encoding(consume_field(data, lay::ident::data));
  h.ei_version = consume_field(data, lay::ident::version);
  h.os_abi = consume_field(data, lay::ident::os_abi);
  h.abi_version = consume_field(data, lay::ident::abi_version);

  data.order = byte_order(h.endian);
  if (h.format == e32) {
    read_body<u32>(data, h);
  } else {
    read_body<u64>(data, h);
  }
  return h;
}

std::vector<uint8_t> elfpeek::encode(header const &h) {
  std::vector<uint8_t> result;
  result.reserve(lay::size_of(h.format));
  auto writer = write_vector(result, byte_order(h.endian));
  writer.write(magic);
  put_field(writer, lay::ident::format, h.format);
  put_field(writer, lay::ident::data, h.endian);
  put_field(writer, lay::ident::version, h.ei_version);
  put_field(writer, lay::ident::os_abi, h.os_abi);
  put_field(writer, lay::ident::abi_version, h.abi_version);
  writer.write(std::array<u8, EI_NIDENT - EI_PAD>{});

  if (h.format == e32) {
    write_body<u32>(writer, h);
  } else {
    write_body<u64>(writer, h);
  }
  return result;
}
