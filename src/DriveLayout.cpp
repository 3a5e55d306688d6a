#include "DriveLayout.h"

#include <algorithm>
#include <utility>

namespace pm5Drive {

const EntryFormat* findEntryFormat(uint8_t version) {
  auto it = std::find_if(
      kEntryFormats.begin(), kEntryFormats.end(),
      [version](const EntryFormat& format) { return format.version == version; });
  return it == kEntryFormats.end() ? nullptr : &*it;
}

std::vector<DirectoryEntry> directorySkeleton(const DriveLayout& layout) {
  return {
      {"Concept2", DirectoryKind::Directory, 0, 0},
      {"Concept2/DiagLog", DirectoryKind::Directory, 0, 0},
      {"Concept2/Firmware", DirectoryKind::Directory, 0, 0},
      {"Concept2/Logbook", DirectoryKind::Directory, 0, 0},
      {"Concept2/Special", DirectoryKind::Directory, 0, 0},
      {"Concept2/Logbook/UserStatic.bin", DirectoryKind::FileRegion,
       layout.metadata.offset, layout.metadata.size},
      {"Concept2/Logbook/LogDataStorage.bin", DirectoryKind::FileRegion,
       layout.logTable.offset, layout.logTable.size},
      {"Concept2/Firmware/Firmware.bin", DirectoryKind::FileRegion,
       layout.firmwareSlot.offset, layout.firmwareSlot.size},
  };
}

bool hasMetadataMarker(std::span<const std::byte> header) {
  auto marker = codec::decodeText(header, kMetadataFields.marker);
  return marker && *marker == kMetadataMarker;
}

std::expected<Bytes, FormatError> encodeMetadata(const DriveMetadata& metadata) {
  if (metadata.directory.size() > kMaxDirectoryEntries) {
    return std::unexpected(FormatError::FieldOverflow);
  }

  Bytes header(kMetadataHeaderSize, std::byte{0});
  const auto& f = kMetadataFields;
  const auto& layout = metadata.layout;

  auto createdAt = codec::encodeTimestamp(metadata.createdAt);
  if (!createdAt) {
    return std::unexpected(createdAt.error());
  }

  const std::pair<Field, uint32_t> numbers[] = {
      {f.layoutVersion, kLayoutVersion},
      {f.headerSize, kMetadataHeaderSize},
      {f.logTableOffset, layout.logTable.offset},
      {f.slotSize, layout.slotSize},
      {f.slotCount, layout.slotCount},
      {f.firmwareSlotOffset, layout.firmwareSlot.offset},
      {f.firmwareSlotSize, layout.firmwareSlot.size},
      {f.userId, metadata.user.id},
      {f.createdAt, *createdAt},
      {f.hardwareRevision, metadata.hardwareRevision},
      {f.directoryCount, static_cast<uint32_t>(metadata.directory.size())},
  };

  if (auto r = codec::encodeText(header, f.marker, kMetadataMarker); !r) {
    return std::unexpected(r.error());
  }
  for (const auto& [field, value] : numbers) {
    if (auto r = codec::encodeField(header, field, value, kMetadataEndian); !r) {
      return std::unexpected(r.error());
    }
  }
  if (auto r = codec::encodeText(header, f.userName, metadata.user.name); !r) {
    return std::unexpected(r.error());
  }

  const auto& d = kDirectoryEntryFields;
  for (size_t i = 0; i < metadata.directory.size(); i++) {
    const DirectoryEntry& entry = metadata.directory[i];
    auto slot = std::span{header}.subspan(
        f.directoryOffset + i * kDirectoryEntrySize, kDirectoryEntrySize);
    if (auto r = codec::encodeText(slot, d.path, entry.path); !r) {
      return std::unexpected(r.error());
    }
    if (auto r = codec::encodeField(slot, d.kind,
                                    static_cast<uint8_t>(entry.kind),
                                    kMetadataEndian);
        !r) {
      return std::unexpected(r.error());
    }
    if (auto r = codec::encodeField(slot, d.offset, entry.offset,
                                    kMetadataEndian);
        !r) {
      return std::unexpected(r.error());
    }
    if (auto r = codec::encodeField(slot, d.size, entry.size, kMetadataEndian);
        !r) {
      return std::unexpected(r.error());
    }
  }

  const uint32_t crc =
      codec::crc32(std::span{header}.first(f.checksum.offset));
  if (auto r = codec::encodeField(header, f.checksum, crc, kMetadataEndian);
      !r) {
    return std::unexpected(r.error());
  }
  return header;
}

std::expected<DriveMetadata, FormatError> decodeMetadata(
    std::span<const std::byte> header) {
  const auto& f = kMetadataFields;
  if (header.size() < kMetadataHeaderSize) {
    return std::unexpected(FormatError::Truncated);
  }
  if (!hasMetadataMarker(header)) {
    return std::unexpected(FormatError::BadMagic);
  }

  auto storedCrc = codec::decodeField(header, f.checksum, kMetadataEndian);
  if (!storedCrc) {
    return std::unexpected(storedCrc.error());
  }
  if (*storedCrc != codec::crc32(header.first(f.checksum.offset))) {
    return std::unexpected(FormatError::ChecksumMismatch);
  }

  auto field = [&](Field which) {
    return codec::decodeField(header, which, kMetadataEndian).value_or(0);
  };

  if (field(f.layoutVersion) != kLayoutVersion ||
      field(f.headerSize) != kMetadataHeaderSize) {
    return std::unexpected(FormatError::UnsupportedVersion);
  }

  DriveMetadata metadata;
  metadata.layout = DriveLayout{
      .metadata = {kMetadataOffset, kMetadataSize},
      .logTable = {field(f.logTableOffset),
                   field(f.slotSize) * field(f.slotCount)},
      .firmwareSlot = {field(f.firmwareSlotOffset), field(f.firmwareSlotSize)},
      .slotSize = static_cast<uint16_t>(field(f.slotSize)),
      .slotCount = static_cast<uint16_t>(field(f.slotCount)),
  };
  if (metadata.layout != DriveLayout::standard()) {
    return std::unexpected(FormatError::UnsupportedVersion);
  }

  metadata.user.id = static_cast<uint16_t>(field(f.userId));
  metadata.user.name = codec::decodeText(header, f.userName).value_or("");
  metadata.hardwareRevision = static_cast<uint16_t>(field(f.hardwareRevision));
  metadata.createdAt = codec::decodeTimestamp(field(f.createdAt));

  const uint32_t count = field(f.directoryCount);
  if (count > kMaxDirectoryEntries) {
    return std::unexpected(FormatError::LengthMismatch);
  }

  const auto& d = kDirectoryEntryFields;
  for (uint32_t i = 0; i < count; i++) {
    auto slot = header.subspan(f.directoryOffset + i * kDirectoryEntrySize,
                               kDirectoryEntrySize);
    auto kind = codec::decodeField(slot, d.kind, kMetadataEndian).value_or(0);
    metadata.directory.push_back(DirectoryEntry{
        .path = codec::decodeText(slot, d.path).value_or(""),
        .kind = kind == 0 ? DirectoryKind::Directory : DirectoryKind::FileRegion,
        .offset = codec::decodeField(slot, d.offset, kMetadataEndian).value_or(0),
        .size = codec::decodeField(slot, d.size, kMetadataEndian).value_or(0),
    });
  }

  return metadata;
}

}  // namespace pm5Drive
