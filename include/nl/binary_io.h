#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nl/common.h"
#include "nl/error.h"

namespace nl {

// Little-endian record encoder for the on-disk state and manifest files.
class BinaryWriter {
 public:
  void Bytes(std::span<const uint8_t> data) { out_.insert(out_.end(), data.begin(), data.end()); }
  void U8(uint8_t value) { out_.push_back(value); }
  void U16(uint16_t value) { Raw(ToLittleEndian16(value)); }
  void U32(uint32_t value) { Raw(ToLittleEndian32(value)); }
  void U64(uint64_t value) { Raw(ToLittleEndian64(value)); }

  // u16 length prefix. Throws Error{Validation} above 65535 bytes.
  void String(std::string_view value) {
    if (value.size() > std::numeric_limits<uint16_t>::max()) {
      throw Error{ErrorDomain::Validation, 0, "String field exceeds 65535 bytes"};
    }
    U16(static_cast<uint16_t>(value.size()));
    Bytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size()));
  }

  std::vector<uint8_t> Take() { return std::move(out_); }

 private:
  template <typename T>
  void Raw(T value) {
    std::array<uint8_t, sizeof(T)> bytes{};
    std::memcpy(bytes.data(), &value, sizeof(T));
    Bytes(bytes);
  }

  std::vector<uint8_t> out_;
};

// Decoder matching BinaryWriter. Truncated input throws Error{domain, code}
// with |what| as the message prefix.
class BinaryReader {
 public:
  BinaryReader(std::span<const uint8_t> data, ErrorDomain domain, int code, std::string_view what)
      : data_(data), domain_(domain), code_(code), what_(what) {}

  std::span<const uint8_t> Bytes(size_t count) {
    if (data_.size() - offset_ < count) {
      Fail("truncated");
    }
    auto view = data_.subspan(offset_, count);
    offset_ += count;
    return view;
  }

  template <size_t N>
  void Into(std::array<uint8_t, N>& out) {
    auto view = Bytes(N);
    std::copy(view.begin(), view.end(), out.begin());
  }

  uint8_t U8() { return Bytes(1)[0]; }
  uint16_t U16() { return FromLittleEndian16(Raw<uint16_t>()); }
  uint32_t U32() { return FromLittleEndian32(Raw<uint32_t>()); }
  uint64_t U64() { return FromLittleEndian64(Raw<uint64_t>()); }

  std::string String() {
    const uint16_t length = U16();
    auto view = Bytes(length);
    return std::string(reinterpret_cast<const char*>(view.data()), view.size());
  }

  bool AtEnd() const noexcept { return offset_ == data_.size(); }

  [[noreturn]] void Fail(std::string_view detail) const {
    throw Error{domain_, code_, std::string(what_) + ": " + std::string(detail)};
  }

 private:
  template <typename T>
  T Raw() {
    auto view = Bytes(sizeof(T));
    T value{};
    std::memcpy(&value, view.data(), sizeof(T));
    return value;
  }

  std::span<const uint8_t> data_;
  size_t offset_{0};
  ErrorDomain domain_;
  int code_;
  std::string_view what_;
};

}  // namespace nl
