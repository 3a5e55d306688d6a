#include "LayoutBuilder.h"

#include <algorithm>
#include <print>
#include <utility>

namespace pm5Drive {

// -----------------------------------------------------------------------------
// Factory & Constructor
// -----------------------------------------------------------------------------

LayoutBuilder::LayoutBuilder(Partition& partition, DriveMetadata metadata)
    : partition_(&partition), metadata_(std::move(metadata)) {}

LayoutBuilder LayoutBuilder::make(Partition& partition, UserProfile profile,
                                  uint16_t hardwareRevision,
                                  std::chrono::sys_seconds createdAt) {
  const DriveLayout layout = DriveLayout::standard();
  return LayoutBuilder(partition, DriveMetadata{
                                      .layout = layout,
                                      .user = std::move(profile),
                                      .hardwareRevision = hardwareRevision,
                                      .createdAt = createdAt,
                                      .directory = directorySkeleton(layout),
                                  });
}

bool LayoutBuilder::isValidUserName(std::string_view name) {
  if (name.empty() || name.size() > kMaxUserNameLength) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return c > 0x20 && c < 0x7F;
  });
}

// -----------------------------------------------------------------------------
// Initialization
// -----------------------------------------------------------------------------

std::expected<DriveLayout, InitFailure> LayoutBuilder::initialize(bool force) {
  const DriveLayout& layout = metadata_.layout;

  if (partition_->size() < layout.requiredSize()) {
    std::println(stderr,
                 "[LayoutBuilder] Partition holds {} bytes, {} required",
                 partition_->size(), layout.requiredSize());
    return std::unexpected(InitFailure{InitError::PartitionTooSmall, {}});
  }

  auto recognized = isRecognized();
  if (!recognized) {
    return std::unexpected(InitFailure{InitError::IoFailure, recognized.error()});
  }
  if (*recognized && !force) {
    return std::unexpected(InitFailure{InitError::AlreadyInitialized, {}});
  }
  if (!isValidUserName(metadata_.user.name)) {
    return std::unexpected(InitFailure{InitError::InvalidUserName, {}});
  }

  // Encoded up front so that a value out of range fails before any write.
  auto header = encodeMetadata(metadata_);
  if (!header) {
    return std::unexpected(InitFailure{InitError::InvalidMetadata, {}});
  }

  struct Step {
    const char* name;
    std::expected<void, IoError> (LayoutBuilder::*method)();
  };

  const Step steps[] = {
      {"Invalidate Metadata", &LayoutBuilder::invalidateMetadata},
      {"Workout Log", &LayoutBuilder::eraseLogTable},
      {"Firmware Slot", &LayoutBuilder::eraseFirmwareSlot},
  };

  for (const auto& step : steps) {
    if (step.method == &LayoutBuilder::invalidateMetadata && !*recognized) {
      continue;
    }
    if (auto result = (this->*(step.method))(); !result) {
      std::println(stderr, "[LayoutBuilder] {} failed: {}", step.name,
                   toString(result.error()));
      return std::unexpected(InitFailure{InitError::IoFailure, result.error()});
    }
  }

  if (auto result = writeMetadata(*header); !result) {
    std::println(stderr, "[LayoutBuilder] Metadata failed: {}",
                 toString(result.error()));
    return std::unexpected(InitFailure{InitError::IoFailure, result.error()});
  }
  if (auto result = partition_->sync(); !result) {
    return std::unexpected(InitFailure{InitError::IoFailure, result.error()});
  }

  std::println("[LayoutBuilder] Drive initialized for user '{}'",
               metadata_.user.name);
  return layout;
}

std::expected<bool, IoError> LayoutBuilder::isRecognized() {
  Bytes header(kMetadataHeaderSize);
  if (auto result = partition_->read(metadata_.layout.metadata.offset, header);
      !result) {
    return std::unexpected(result.error());
  }
  return hasMetadataMarker(header);
}

// -----------------------------------------------------------------------------
// Write Operations
// -----------------------------------------------------------------------------

std::expected<void, IoError> LayoutBuilder::invalidateMetadata() {
  const Region& region = metadata_.layout.metadata;
  std::println("[LayoutBuilder] Invalidating existing metadata...");
  if (auto result = partition_->fill(region.offset, region.size, std::byte{0});
      !result) {
    return result;
  }
  // The header must be gone from the device before any history is erased.
  return partition_->sync();
}

std::expected<void, IoError> LayoutBuilder::eraseLogTable() {
  const DriveLayout& layout = metadata_.layout;
  std::println("[LayoutBuilder] Erasing workout log ({} slots)...",
               layout.slotCount);
  return partition_->fill(layout.logTable.offset, layout.logTable.size,
                          kErasedByte);
}

std::expected<void, IoError> LayoutBuilder::eraseFirmwareSlot() {
  const Region& region = metadata_.layout.firmwareSlot;
  std::println("[LayoutBuilder] Erasing firmware slot ({} bytes)...",
               region.size);
  return partition_->fill(region.offset, region.size, kErasedByte);
}

std::expected<void, IoError> LayoutBuilder::writeMetadata(
    std::span<const std::byte> header) {
  const Region& region = metadata_.layout.metadata;
  Bytes image(region.size, std::byte{0});
  std::copy_n(header.begin(), std::min<size_t>(header.size(), image.size()),
              image.begin());

  std::println("[LayoutBuilder] Writing metadata header...");
  return partition_->write(region.offset, image);
}

}  // namespace pm5Drive
