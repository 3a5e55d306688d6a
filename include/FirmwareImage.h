// =============================================================================
// FirmwareImage.h
// =============================================================================
//
// Validation and staging of monitor firmware images.
//
// A firmware image is a 64-byte little-endian header followed by the payload:
//
//   Off  Width  Field
//   0    4      magic "C2FW"
//   4    2      header version (1)
//   6    2      header size (64)
//   8    2      version major
//   10   2      version minor
//   12   2      target hardware revision
//   14   2      flags (bit 0: beta)
//   16   4      payload length
//   20   4      payload CRC-32
//   24   28     version text, null padded
//   52   4      build time, seconds since the device epoch
//   60   4      header CRC-32 over bytes 0..59
//
// A FirmwareImage value only exists once every one of these checks has
// passed. There is no "unknown validity" state: load() either returns a
// proven image or the reason it refused.
//
// This component never touches storage. It hands the Drive Session the exact
// bytes and destination of the slot write.
//
// =============================================================================

#ifndef PM5_DRIVE_FIRMWARE_IMAGE_H
#define PM5_DRIVE_FIRMWARE_IMAGE_H

#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

#include "BinaryCodec.h"
#include "DriveLayout.h"
#include "DriveResult.h"

namespace pm5Drive {

static constexpr Endian kFirmwareEndian = Endian::Little;
static constexpr std::string_view kFirmwareMagic = "C2FW";
static constexpr uint16_t kFirmwareHeaderVersion = 1;
static constexpr uint16_t kFirmwareHeaderSize = 64;
static constexpr uint16_t kFirmwareFlagBeta = 0x0001;

struct FirmwareHeaderFields {
  Field magic{0, 4};
  Field headerVersion{4, 2};
  Field headerSize{6, 2};
  Field versionMajor{8, 2};
  Field versionMinor{10, 2};
  Field hardwareRevision{12, 2};
  Field flags{14, 2};
  Field payloadLength{16, 4};
  Field payloadCrc{20, 4};
  Field versionText{24, 28};
  Field buildTime{52, 4};
  Field headerCrc{60, 4};
};

inline constexpr FirmwareHeaderFields kFirmwareHeaderFields{};

struct FirmwareInfo {
  uint16_t versionMajor = 0;
  uint16_t versionMinor = 0;
  uint16_t hardwareRevision = 0;
  bool beta = false;
  std::string versionText;
  std::chrono::sys_seconds buildTime{
      std::chrono::seconds{codec::kDeviceEpochUnixSeconds}};

  bool operator==(const FirmwareInfo&) const = default;
};

// Destination contract for a staged image: write exactly `bytes` at the
// partition-relative `offset`.
struct SlotWrite {
  uint64_t offset;
  std::span<const std::byte> bytes;
};

class FirmwareImage {
public:
  static std::expected<FirmwareImage, FormatError> load(
      std::span<const std::byte> bytes);

  // Builds a valid image around a payload, computing both checksums.
  static std::expected<Bytes, FormatError> package(
      const FirmwareInfo& info, std::span<const std::byte> payload);

  const FirmwareInfo& info() const { return info_; }
  uint16_t hardwareRevision() const { return info_.hardwareRevision; }
  uint32_t payloadCrc() const { return payloadCrc_; }
  uint32_t imageCrc() const { return codec::crc32(image_); }
  std::span<const std::byte> payload() const {
    return std::span{image_}.subspan(kFirmwareHeaderSize);
  }

  // Header and payload, exactly as they go into the firmware slot.
  std::span<const std::byte> slotBytes() const { return image_; }

  std::expected<SlotWrite, FlashError> stage(const DriveLayout& layout) const;

  std::string versionString() const;

private:
  FirmwareImage(FirmwareInfo info, uint32_t payloadCrc, Bytes image);

  FirmwareInfo info_;
  uint32_t payloadCrc_;
  Bytes image_;
};

std::expected<void, IncompatibleError> verifyCompatible(
    const FirmwareImage& image, uint16_t deviceHardwareRevision);

}  // namespace pm5Drive

#endif  // PM5_DRIVE_FIRMWARE_IMAGE_H
