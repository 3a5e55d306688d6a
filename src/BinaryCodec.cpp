#include "BinaryCodec.h"

#include <algorithm>
#include <limits>

namespace pm5Drive::codec {

namespace {

std::expected<void, FormatError> encodeUnsigned(std::span<std::byte> out,
                                                uint32_t value, size_t width,
                                                Endian endian) {
  if (out.size() < width) {
    return std::unexpected(FormatError::Truncated);
  }
  if (width < 4 && value >= (uint32_t{1} << (width * 8))) {
    return std::unexpected(FormatError::FieldOverflow);
  }
  for (size_t i = 0; i < width; i++) {
    size_t shift = (endian == Endian::Little) ? i : (width - 1 - i);
    out[i] = static_cast<std::byte>((value >> (shift * 8)) & 0xFF);
  }
  return {};
}

std::expected<uint32_t, FormatError> decodeUnsigned(
    std::span<const std::byte> in, size_t width, Endian endian) {
  if (in.size() < width) {
    return std::unexpected(FormatError::Truncated);
  }
  uint32_t value = 0;
  for (size_t i = 0; i < width; i++) {
    size_t shift = (endian == Endian::Little) ? i : (width - 1 - i);
    value |= std::to_integer<uint32_t>(in[i]) << (shift * 8);
  }
  return value;
}

bool validWidth(uint16_t width) {
  return width == 1 || width == 2 || width == 4;
}

}  // namespace

std::expected<void, FormatError> encodeU8(std::span<std::byte> out,
                                          uint8_t value) {
  return encodeUnsigned(out, value, 1, Endian::Little);
}

std::expected<void, FormatError> encodeU16(std::span<std::byte> out,
                                           uint16_t value, Endian endian) {
  return encodeUnsigned(out, value, 2, endian);
}

std::expected<void, FormatError> encodeU32(std::span<std::byte> out,
                                           uint32_t value, Endian endian) {
  return encodeUnsigned(out, value, 4, endian);
}

std::expected<uint8_t, FormatError> decodeU8(std::span<const std::byte> in) {
  auto v = decodeUnsigned(in, 1, Endian::Little);
  if (!v) return std::unexpected(v.error());
  return static_cast<uint8_t>(*v);
}

std::expected<uint16_t, FormatError> decodeU16(std::span<const std::byte> in,
                                               Endian endian) {
  auto v = decodeUnsigned(in, 2, endian);
  if (!v) return std::unexpected(v.error());
  return static_cast<uint16_t>(*v);
}

std::expected<uint32_t, FormatError> decodeU32(std::span<const std::byte> in,
                                               Endian endian) {
  return decodeUnsigned(in, 4, endian);
}

std::expected<void, FormatError> encodeField(std::span<std::byte> buffer,
                                             Field field, uint32_t value,
                                             Endian endian) {
  if (!field.present()) {
    return {};
  }
  if (!validWidth(field.width)) {
    return std::unexpected(FormatError::FieldOverflow);
  }
  if (buffer.size() < field.end()) {
    return std::unexpected(FormatError::Truncated);
  }
  return encodeUnsigned(buffer.subspan(field.offset, field.width), value,
                        field.width, endian);
}

std::expected<uint32_t, FormatError> decodeField(
    std::span<const std::byte> buffer, Field field, Endian endian) {
  if (!field.present()) {
    return 0u;
  }
  if (!validWidth(field.width)) {
    return std::unexpected(FormatError::FieldOverflow);
  }
  if (buffer.size() < field.end()) {
    return std::unexpected(FormatError::Truncated);
  }
  return decodeUnsigned(buffer.subspan(field.offset, field.width),
                        field.width, endian);
}

std::expected<void, FormatError> encodeText(std::span<std::byte> buffer,
                                            Field field, std::string_view text,
                                            Padding padding) {
  if (!field.present()) {
    return {};
  }
  if (buffer.size() < field.end()) {
    return std::unexpected(FormatError::Truncated);
  }
  if (text.size() > field.width) {
    return std::unexpected(FormatError::FieldOverflow);
  }
  // Decoding stops at a null and drops trailing spaces.
  if (text.find('\0') != std::string_view::npos ||
      (!text.empty() && text.back() == ' ')) {
    return std::unexpected(FormatError::InvalidField);
  }
  auto out = buffer.subspan(field.offset, field.width);
  auto source = asBytes(text);
  std::fill(out.begin(), out.end(), static_cast<std::byte>(padding));
  std::copy(source.begin(), source.end(), out.begin());
  return {};
}

std::expected<std::string, FormatError> decodeText(
    std::span<const std::byte> buffer, Field field) {
  if (!field.present()) {
    return std::string{};
  }
  if (buffer.size() < field.end()) {
    return std::unexpected(FormatError::Truncated);
  }
  auto in = buffer.subspan(field.offset, field.width);
  std::string text;
  text.reserve(in.size());
  for (std::byte b : in) {
    if (b == std::byte{0}) {
      break;
    }
    text.push_back(static_cast<char>(b));
  }
  while (!text.empty() && text.back() == ' ') {
    text.pop_back();
  }
  return text;
}

std::expected<uint32_t, FormatError> encodeTimestamp(
    std::chrono::sys_seconds time) {
  const int64_t seconds =
      time.time_since_epoch().count() - kDeviceEpochUnixSeconds;
  if (seconds < 0 || seconds > std::numeric_limits<uint32_t>::max()) {
    return std::unexpected(FormatError::FieldOverflow);
  }
  return static_cast<uint32_t>(seconds);
}

std::chrono::sys_seconds decodeTimestamp(uint32_t deviceSeconds) {
  return std::chrono::sys_seconds{
      std::chrono::seconds{kDeviceEpochUnixSeconds + int64_t{deviceSeconds}}};
}

uint16_t crc16(std::span<const std::byte> data, uint16_t seed) {
  uint16_t crc = seed;
  for (std::byte b : data) {
    crc ^= static_cast<uint16_t>(std::to_integer<uint16_t>(b) << 8);
    for (int bit = 0; bit < 8; bit++) {
      crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ 0x1021)
                           : static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

uint32_t crc32(std::span<const std::byte> data, uint32_t seed) {
  uint32_t crc = ~seed;
  for (std::byte b : data) {
    crc ^= std::to_integer<uint32_t>(b);
    for (int bit = 0; bit < 8; bit++) {
      crc = (crc >> 1) ^ (0xEDB88320u & (0u - (crc & 1u)));
    }
  }
  return ~crc;
}

bool allBytesEqual(std::span<const std::byte> data, std::byte value) {
  return std::all_of(data.begin(), data.end(),
                     [value](std::byte b) { return b == value; });
}

}  // namespace pm5Drive::codec
