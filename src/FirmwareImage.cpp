#include "FirmwareImage.h"

#include <algorithm>
#include <format>
#include <limits>
#include <utility>

namespace pm5Drive {

FirmwareImage::FirmwareImage(FirmwareInfo info, uint32_t payloadCrc,
                             Bytes image)
    : info_(std::move(info)), payloadCrc_(payloadCrc), image_(std::move(image)) {}

std::expected<FirmwareImage, FormatError> FirmwareImage::load(
    std::span<const std::byte> bytes) {
  const auto& f = kFirmwareHeaderFields;
  auto field = [&](Field which) {
    return codec::decodeField(bytes, which, kFirmwareEndian).value_or(0);
  };

  if (bytes.size() < kFirmwareHeaderSize) {
    return std::unexpected(FormatError::Truncated);
  }
  if (codec::decodeText(bytes, f.magic).value_or("") != kFirmwareMagic) {
    return std::unexpected(FormatError::BadMagic);
  }
  if (field(f.headerVersion) != kFirmwareHeaderVersion ||
      field(f.headerSize) != kFirmwareHeaderSize) {
    return std::unexpected(FormatError::UnsupportedVersion);
  }
  if (field(f.headerCrc) != codec::crc32(bytes.first(f.headerCrc.offset))) {
    return std::unexpected(FormatError::ChecksumMismatch);
  }

  const uint32_t payloadLength = field(f.payloadLength);
  if (bytes.size() != uint64_t{kFirmwareHeaderSize} + payloadLength) {
    return std::unexpected(FormatError::LengthMismatch);
  }

  const uint32_t payloadCrc = field(f.payloadCrc);
  if (payloadCrc != codec::crc32(bytes.subspan(kFirmwareHeaderSize))) {
    return std::unexpected(FormatError::ChecksumMismatch);
  }

  FirmwareInfo info{
      .versionMajor = static_cast<uint16_t>(field(f.versionMajor)),
      .versionMinor = static_cast<uint16_t>(field(f.versionMinor)),
      .hardwareRevision = static_cast<uint16_t>(field(f.hardwareRevision)),
      .beta = (field(f.flags) & kFirmwareFlagBeta) != 0,
      .versionText = codec::decodeText(bytes, f.versionText).value_or(""),
      .buildTime = codec::decodeTimestamp(field(f.buildTime)),
  };

  return FirmwareImage(std::move(info), payloadCrc,
                       Bytes(bytes.begin(), bytes.end()));
}

std::expected<Bytes, FormatError> FirmwareImage::package(
    const FirmwareInfo& info, std::span<const std::byte> payload) {
  if (payload.size() > std::numeric_limits<uint32_t>::max()) {
    return std::unexpected(FormatError::FieldOverflow);
  }
  auto buildTime = codec::encodeTimestamp(info.buildTime);
  if (!buildTime) {
    return std::unexpected(buildTime.error());
  }

  const auto& f = kFirmwareHeaderFields;
  Bytes image(kFirmwareHeaderSize + payload.size(), std::byte{0});
  std::copy(payload.begin(), payload.end(),
            image.begin() + kFirmwareHeaderSize);

  const std::pair<Field, uint32_t> values[] = {
      {f.headerVersion, kFirmwareHeaderVersion},
      {f.headerSize, kFirmwareHeaderSize},
      {f.versionMajor, info.versionMajor},
      {f.versionMinor, info.versionMinor},
      {f.hardwareRevision, info.hardwareRevision},
      {f.flags, info.beta ? kFirmwareFlagBeta : 0u},
      {f.payloadLength, static_cast<uint32_t>(payload.size())},
      {f.payloadCrc, codec::crc32(payload)},
      {f.buildTime, *buildTime},
  };

  if (auto r = codec::encodeText(image, f.magic, kFirmwareMagic); !r) {
    return std::unexpected(r.error());
  }
  for (const auto& [field, value] : values) {
    if (auto r = codec::encodeField(image, field, value, kFirmwareEndian); !r) {
      return std::unexpected(r.error());
    }
  }
  if (auto r = codec::encodeText(image, f.versionText, info.versionText); !r) {
    return std::unexpected(r.error());
  }

  const uint32_t headerCrc =
      codec::crc32(std::span{image}.first(f.headerCrc.offset));
  if (auto r = codec::encodeField(image, f.headerCrc, headerCrc,
                                  kFirmwareEndian);
      !r) {
    return std::unexpected(r.error());
  }
  return image;
}

std::expected<SlotWrite, FlashError> FirmwareImage::stage(
    const DriveLayout& layout) const {
  if (image_.size() > layout.firmwareSlot.size) {
    return std::unexpected(FlashError::TooLarge);
  }
  return SlotWrite{.offset = layout.firmwareSlot.offset, .bytes = image_};
}

std::string FirmwareImage::versionString() const {
  std::string text = std::format("{}.{:03}", info_.versionMajor,
                                 info_.versionMinor);
  if (!info_.versionText.empty()) {
    text = std::format("{} ({})", info_.versionText, text);
  }
  if (info_.beta) {
    text += " beta";
  }
  return text;
}

std::expected<void, IncompatibleError> verifyCompatible(
    const FirmwareImage& image, uint16_t deviceHardwareRevision) {
  if (image.hardwareRevision() != deviceHardwareRevision) {
    return std::unexpected(IncompatibleError::HardwareRevisionMismatch);
  }
  return {};
}

}  // namespace pm5Drive
