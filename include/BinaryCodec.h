// =============================================================================
// BinaryCodec.h
// =============================================================================
//
// Primitive field codec for the PM5 drive format.
//
// Every on-disk structure in this project (workout slots, metadata header,
// firmware header) is described as a table of Field values: a byte offset
// and a width. The functions here read and write one such field in a given
// byte order, so layouts are data rather than scattered pointer arithmetic.
//
// Contract:
//   - Decoders never throw and never abort. A buffer too short for the field
//     yields FormatError::Truncated; any other bytes decode to some value
//     that the caller validates.
//   - Encoders yield FormatError::Truncated when the output is too short and
//     FormatError::FieldOverflow when the value does not fit the width.
//   - A Field with width 0 is absent from that format version. Decoding it
//     yields 0, encoding it writes nothing.
//
// =============================================================================

#ifndef PM5_DRIVE_BINARY_CODEC_H
#define PM5_DRIVE_BINARY_CODEC_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "DriveResult.h"

namespace pm5Drive {

using Bytes = std::vector<std::byte>;

enum class Endian { Little, Big };

enum class Padding : char { Null = '\0', Space = ' ' };

struct Field {
  uint16_t offset;
  uint16_t width;

  constexpr bool present() const { return width != 0; }
  constexpr uint32_t end() const { return uint32_t{offset} + width; }
};

namespace codec {

// Seconds between the Unix epoch and the device epoch (2000-01-01T00:00:00Z).
inline constexpr int64_t kDeviceEpochUnixSeconds = 946684800;

// -----------------------------------------------------------------------------
// Fixed-width integers
// -----------------------------------------------------------------------------

std::expected<void, FormatError> encodeU8(std::span<std::byte> out,
                                          uint8_t value);
std::expected<void, FormatError> encodeU16(std::span<std::byte> out,
                                           uint16_t value, Endian endian);
std::expected<void, FormatError> encodeU32(std::span<std::byte> out,
                                           uint32_t value, Endian endian);

std::expected<uint8_t, FormatError> decodeU8(std::span<const std::byte> in);
std::expected<uint16_t, FormatError> decodeU16(std::span<const std::byte> in,
                                               Endian endian);
std::expected<uint32_t, FormatError> decodeU32(std::span<const std::byte> in,
                                               Endian endian);

// Width 1, 2 or 4 at field.offset within the buffer.
std::expected<void, FormatError> encodeField(std::span<std::byte> buffer,
                                             Field field, uint32_t value,
                                             Endian endian);
std::expected<uint32_t, FormatError> decodeField(
    std::span<const std::byte> buffer, Field field, Endian endian);

// -----------------------------------------------------------------------------
// Text
// -----------------------------------------------------------------------------

// Writes text padded to field.width. Text longer than the field is a
// FieldOverflow, never silently truncated. Text holding a null byte or ending
// in a space would not decode back unchanged and is an InvalidField.
std::expected<void, FormatError> encodeText(std::span<std::byte> buffer,
                                            Field field, std::string_view text,
                                            Padding padding = Padding::Null);

// Reads field.width bytes and strips trailing null and space padding. Text
// stops at the first null byte.
std::expected<std::string, FormatError> decodeText(
    std::span<const std::byte> buffer, Field field);

// -----------------------------------------------------------------------------
// Timestamps
// -----------------------------------------------------------------------------

// Seconds since the device epoch. Times before the epoch or past 2136 do not
// fit and yield FieldOverflow.
std::expected<uint32_t, FormatError> encodeTimestamp(
    std::chrono::sys_seconds time);
std::chrono::sys_seconds decodeTimestamp(uint32_t deviceSeconds);

// -----------------------------------------------------------------------------
// Checksums
// -----------------------------------------------------------------------------

// CRC-16/CCITT-FALSE (poly 0x1021, init 0xFFFF, no reflection, no xorout).
// Pass a previous result as seed to continue over a second range.
uint16_t crc16(std::span<const std::byte> data, uint16_t seed = 0xFFFF);

// CRC-32/ISO-HDLC (reflected poly 0xEDB88320). Pass a previous result as
// seed to continue over a second range.
uint32_t crc32(std::span<const std::byte> data, uint32_t seed = 0);

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

inline std::span<const std::byte> asBytes(std::string_view text) {
  return std::as_bytes(std::span{text.data(), text.size()});
}

bool allBytesEqual(std::span<const std::byte> data, std::byte value);

}  // namespace codec
}  // namespace pm5Drive

#endif  // PM5_DRIVE_BINARY_CODEC_H
