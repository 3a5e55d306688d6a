// =============================================================================
// DriveLayout.h
// =============================================================================
//
// Format constants of the PM5 drive region and the declarative tables that
// describe its records.
//
// Partition-Relative Layout
// -------------------------
//
//   ┌──────────────────────────────────────────────────────────────────────┐
//   │ 0x000000   Metadata region (4 KB)                                    │
//   │             ├─ Header (512 bytes): marker, layout, user, revision    │
//   │             └─ Directory skeleton table inside the header            │
//   ├──────────────────────────────────────────────────────────────────────┤
//   │ 0x001000   Workout log slot table                                    │
//   │             512 slots × 2048 bytes, erased slots are all 0xFF        │
//   ├──────────────────────────────────────────────────────────────────────┤
//   │ 0x101000   (unused gap up to the 64 KB boundary)                     │
//   ├──────────────────────────────────────────────────────────────────────┤
//   │ 0x110000   Firmware slot (2 MB)                                      │
//   │             Firmware header (64 bytes) followed by the payload       │
//   └──────────────────────────────────────────────────────────────────────┘
//
// These offsets are constants of the format, never computed from the device
// size. Initialization writes them into the metadata header and every open
// checks that the stored values still match.
//
// Versioned Records
// -----------------
// Workout entry slots carry a version byte. Each version is one row of
// kEntryFormats: a header table and an interval table of (offset, width)
// fields. A new monitor revision is supported by adding a row.
//
// =============================================================================

#ifndef PM5_DRIVE_LAYOUT_H
#define PM5_DRIVE_LAYOUT_H

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "BinaryCodec.h"
#include "DriveResult.h"

namespace pm5Drive {

// -----------------------------------------------------------------------------
// Region Geometry
// -----------------------------------------------------------------------------

struct Region {
  uint32_t offset;
  uint32_t size;

  constexpr uint64_t end() const { return uint64_t{offset} + size; }
  constexpr bool operator==(const Region&) const = default;
};

struct DriveLayout {
  Region metadata;
  Region logTable;
  Region firmwareSlot;
  uint16_t slotSize;
  uint16_t slotCount;

  static constexpr DriveLayout standard();

  constexpr uint64_t slotOffset(uint32_t slot) const {
    return uint64_t{logTable.offset} + uint64_t{slot} * slotSize;
  }
  constexpr uint64_t requiredSize() const { return firmwareSlot.end(); }
  constexpr bool operator==(const DriveLayout&) const = default;
};

static constexpr uint32_t kMetadataOffset = 0x000000;
static constexpr uint32_t kMetadataSize = 0x1000;
static constexpr uint32_t kLogTableOffset = 0x001000;
static constexpr uint16_t kSlotSize = 2048;
static constexpr uint16_t kSlotCount = 512;
static constexpr uint32_t kFirmwareSlotOffset = 0x110000;
static constexpr uint32_t kFirmwareSlotSize = 0x200000;

constexpr DriveLayout DriveLayout::standard() {
  return DriveLayout{
      .metadata = {kMetadataOffset, kMetadataSize},
      .logTable = {kLogTableOffset, uint32_t{kSlotSize} * kSlotCount},
      .firmwareSlot = {kFirmwareSlotOffset, kFirmwareSlotSize},
      .slotSize = kSlotSize,
      .slotCount = kSlotCount,
  };
}

static_assert(DriveLayout::standard().logTable.end() <= kFirmwareSlotOffset,
              "slot table must not overlap the firmware slot");
static_assert(kMetadataOffset + kMetadataSize <= kLogTableOffset,
              "metadata must not overlap the slot table");

// -----------------------------------------------------------------------------
// Workout Entry Formats
// -----------------------------------------------------------------------------

static constexpr Endian kEntryEndian = Endian::Big;
static constexpr uint8_t kEntryMagic = 0xF0;
static constexpr uint8_t kMaxIntervals = 50;
static constexpr std::byte kErasedByte{0xFF};

// Shared by every version so that a slot can be verified before its version
// byte is trusted.
static constexpr Field kEntryMagicField{0, 1};
static constexpr Field kEntryVersionField{1, 1};
static constexpr Field kEntryChecksumField{2, 2};
static constexpr Field kEntryLengthField{4, 2};

struct EntryHeaderFields {
  Field workoutType;
  Field intervalCount;
  Field entryId;
  Field userId;
  Field serialNumber;
  Field startTime;
  Field totalDuration;
  Field totalDistance;
  Field restDuration;
  Field calories;
  Field strokeRate;
  Field heartRate;
  Field name;
  Field dragFactor;
};

struct IntervalFields {
  Field kind;
  Field strokeRate;
  Field heartRate;
  Field target;
  Field duration;
  Field distance;
  Field pace;
  Field calories;
  Field watts;
};

struct EntryFormat {
  uint8_t version;
  uint16_t headerSize;
  uint16_t intervalSize;
  EntryHeaderFields header;
  IntervalFields interval;

  constexpr uint32_t lengthFor(uint32_t intervalCount) const {
    return uint32_t{headerSize} + intervalCount * intervalSize;
  }
};

inline constexpr std::array<EntryFormat, 2> kEntryFormats{{
    {
        .version = 1,
        .headerSize = 48,
        .intervalSize = 24,
        .header =
            {
                .workoutType = {6, 1},
                .intervalCount = {7, 1},
                .entryId = {8, 2},
                .userId = {10, 2},
                .serialNumber = {12, 4},
                .startTime = {16, 4},
                .totalDuration = {20, 4},
                .totalDistance = {24, 4},
                .restDuration = {28, 4},
                .calories = {32, 2},
                .strokeRate = {34, 1},
                .heartRate = {35, 1},
                .name = {36, 12},
                .dragFactor = {0, 0},
            },
        .interval =
            {
                .kind = {0, 1},
                .strokeRate = {1, 1},
                .heartRate = {2, 1},
                .target = {4, 4},
                .duration = {8, 4},
                .distance = {12, 4},
                .pace = {16, 2},
                .calories = {18, 2},
                .watts = {0, 0},
            },
    },
    {
        .version = 2,
        .headerSize = 64,
        .intervalSize = 32,
        .header =
            {
                .workoutType = {6, 1},
                .intervalCount = {7, 1},
                .entryId = {8, 2},
                .userId = {10, 2},
                .serialNumber = {12, 4},
                .startTime = {16, 4},
                .totalDuration = {20, 4},
                .totalDistance = {24, 4},
                .restDuration = {28, 4},
                .calories = {32, 2},
                .strokeRate = {34, 1},
                .heartRate = {35, 1},
                .name = {36, 16},
                .dragFactor = {52, 1},
            },
        .interval =
            {
                .kind = {0, 1},
                .strokeRate = {1, 1},
                .heartRate = {2, 1},
                .target = {4, 4},
                .duration = {8, 4},
                .distance = {12, 4},
                .pace = {16, 2},
                .calories = {18, 2},
                .watts = {20, 2},
            },
    },
}};

static constexpr uint8_t kCurrentEntryVersion = 2;

// Returns nullptr for versions without a table row.
const EntryFormat* findEntryFormat(uint8_t version);

static_assert(kEntryFormats[0].lengthFor(kMaxIntervals) <= kSlotSize &&
                  kEntryFormats[1].lengthFor(kMaxIntervals) <= kSlotSize,
              "a slot must hold the maximum interval count");

// -----------------------------------------------------------------------------
// Metadata Header
// -----------------------------------------------------------------------------

static constexpr Endian kMetadataEndian = Endian::Little;
static constexpr std::string_view kMetadataMarker = "C2PM5LOG";
static constexpr uint16_t kLayoutVersion = 1;
static constexpr uint16_t kMetadataHeaderSize = 512;
static constexpr size_t kMaxUserNameLength = 6;
static constexpr size_t kMaxDirectoryEntries = 8;
static constexpr uint16_t kDirectoryEntrySize = 48;

struct MetadataFields {
  Field marker{0, 8};
  Field layoutVersion{8, 2};
  Field headerSize{10, 2};
  Field logTableOffset{12, 4};
  Field slotSize{16, 2};
  Field slotCount{18, 2};
  Field firmwareSlotOffset{20, 4};
  Field firmwareSlotSize{24, 4};
  Field userId{28, 2};
  Field userName{30, 6};
  Field createdAt{36, 4};
  Field hardwareRevision{40, 2};
  Field directoryCount{42, 2};
  uint16_t directoryOffset{64};
  Field checksum{508, 4};
};

struct DirectoryEntryFields {
  Field path{0, 38};
  Field kind{38, 1};
  Field offset{40, 4};
  Field size{44, 4};
};

inline constexpr MetadataFields kMetadataFields{};
inline constexpr DirectoryEntryFields kDirectoryEntryFields{};

static_assert(kMetadataFields.directoryOffset +
                      kMaxDirectoryEntries * kDirectoryEntrySize <=
                  kMetadataFields.checksum.offset,
              "directory table must end before the header checksum");

enum class DirectoryKind : uint8_t { Directory = 0, FileRegion = 1 };

struct DirectoryEntry {
  std::string path;
  DirectoryKind kind;
  uint32_t offset;
  uint32_t size;

  bool operator==(const DirectoryEntry&) const = default;
};

// Directories and region-backed files the monitor looks for.
std::vector<DirectoryEntry> directorySkeleton(const DriveLayout& layout);

struct UserProfile {
  std::string name;
  uint16_t id = 0;

  bool operator==(const UserProfile&) const = default;
};

struct DriveMetadata {
  DriveLayout layout = DriveLayout::standard();
  UserProfile user;
  uint16_t hardwareRevision = 0;
  std::chrono::sys_seconds createdAt{};
  std::vector<DirectoryEntry> directory;

  bool operator==(const DriveMetadata&) const = default;
};

// Checks only the marker; a damaged header still counts as initialized so
// that existing workout history is never overwritten without force.
bool hasMetadataMarker(std::span<const std::byte> header);

std::expected<Bytes, FormatError> encodeMetadata(const DriveMetadata& metadata);
std::expected<DriveMetadata, FormatError> decodeMetadata(
    std::span<const std::byte> header);

}  // namespace pm5Drive

#endif  // PM5_DRIVE_LAYOUT_H
