#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

template <std::unsigned_integral T> constexpr T byteswap(T value) noexcept {
  T result{};
  for (size_t i = 0; i < sizeof(T); ++i) {
    result = static_cast<T>((result << 8) | (value & 0xff));
    value = static_cast<T>(value >> 8);
  }
  return result;
}

// Converts between native order and the given order. Symmetric, so it is used
// for both reading and writing.
template <std::unsigned_integral T>
constexpr T to_order(T value, std::endian order) noexcept {
  if (order == std::endian::native)
    return value;
  return byteswap(value);
}

struct Reader {
  const uint8_t *origin{}, *begin{}, *end{};
  std::endian order = std::endian::little;
  Reader(std::span<const uint8_t> buffer_view,
         std::endian order = std::endian::little)
      : origin(buffer_view.data()), begin(buffer_view.data()),
        end(buffer_view.data() + buffer_view.size()), order(order) {}

  template <std::unsigned_integral T> T consume() {
    T result = view<T>();
    increment(sizeof(T));
    return result;
  }

  template <std::unsigned_integral T> T view() const {
    if (sizeof(T) > remaining())
      throw std::out_of_range("read past the end of the buffer");
    T result;
    std::memcpy(&result, begin, sizeof(T));
    return to_order(result, order);
  }

  void increment(size_t len) {
    if (len > remaining())
      throw std::out_of_range("incremented out of range");
    begin += len;
  }

  void seek(size_t pos) {
    if (pos > size())
      throw std::out_of_range("seek out of range");
    begin = origin + pos;
  }

  size_t bytes_read() const noexcept { return begin - origin; }
  size_t remaining() const noexcept { return end - begin; }
  size_t size() const noexcept { return end - origin; }
  bool empty() const noexcept { return begin >= end; }
};

template <std::invocable<const void *, size_t> Callback> struct Writer {
  Callback callback;
  std::endian order = std::endian::little;
  size_t bytes_written = 0;
  Writer(Callback c, std::endian order = std::endian::little)
      : callback(std::move(c)), order(order) {}

  void write(std::span<const uint8_t> data) {
    callback(data.data(), data.size_bytes());
    bytes_written += data.size_bytes();
  }
  template <std::unsigned_integral T> void write(T data) {
    data = to_order(data, order);
    callback(&data, sizeof(T));
    bytes_written += sizeof(T);
  }
};

inline auto write_vector(std::vector<uint8_t> &vec,
                         std::endian order = std::endian::little) {
  return Writer(
      [&vec](const void *data, size_t size) {
        auto bytes = static_cast<const uint8_t *>(data);
        vec.insert(vec.end(), bytes, bytes + size);
      },
      order);
}
