#ifndef PM5_DRIVE_LAYOUT_BUILDER_H
#define PM5_DRIVE_LAYOUT_BUILDER_H

#include <chrono>
#include <cstdint>
#include <expected>

#include "BlockStorage.h"
#include "DriveLayout.h"
#include "DriveResult.h"

namespace pm5Drive {

/**
 * @brief Writes the regions a monitor needs to recognize a drive.
 *
 * initialize() runs the write steps in a fixed order with the metadata
 * header last. Until that final write lands the partition carries no
 * marker, so an interrupted run leaves it unrecognized rather than half
 * valid.
 */
class LayoutBuilder {
public:
  // Factory
  static LayoutBuilder make(Partition& partition, UserProfile profile,
                            uint16_t hardwareRevision,
                            std::chrono::sys_seconds createdAt);

  std::expected<DriveLayout, InitFailure> initialize(bool force);

  // Marker check on the current metadata header.
  std::expected<bool, IoError> isRecognized();

  // Atomic Write Operations
  std::expected<void, IoError> invalidateMetadata();
  std::expected<void, IoError> eraseLogTable();
  std::expected<void, IoError> eraseFirmwareSlot();
  std::expected<void, IoError> writeMetadata(std::span<const std::byte> header);

  const DriveMetadata& metadata() const { return metadata_; }

  static bool isValidUserName(std::string_view name);

private:
  LayoutBuilder(Partition& partition, DriveMetadata metadata);

  Partition* partition_;
  DriveMetadata metadata_;
};

}  // namespace pm5Drive

#endif  // PM5_DRIVE_LAYOUT_BUILDER_H
