#ifndef PM5_DRIVE_OPERATIONS_H
#define PM5_DRIVE_OPERATIONS_H

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "DriveSession.h"

namespace pm5Drive {

// -----------------------------------------------------------------------------
// Operation Surface
// -----------------------------------------------------------------------------
//
// One call, one device handle: each function opens the device or image at
// `path`, runs a single session operation and releases the handle before
// returning, whatever the outcome.

struct DriveInfo {
  DriveMetadata metadata;
  uint64_t partitionOrigin = 0;
  uint64_t partitionSize = 0;
  uint8_t partitionType = 0;
  DriveSummary summary;
  std::optional<FirmwareInfo> firmware;
  // Set when the firmware slot is neither erased nor a valid image.
  std::optional<FormatError> firmwareError;
};

std::expected<DriveLayout, InitFailure> initDrive(const std::string& path,
                                                  const InitOptions& options);

std::expected<std::vector<ScanItem>, SessionFailure> listDrive(
    const std::string& path);

// The newest entry when `entryId` is empty.
std::expected<StoredEntry, SessionFailure> exportEntry(
    const std::string& path, std::optional<uint16_t> entryId);

// `confirm` must be true before the firmware file is even read.
std::expected<FlashSummary, FlashReport> flashDrive(
    const std::string& path, const std::string& firmwarePath, bool confirm,
    const FlashProgress& progress = {});

std::expected<DriveInfo, SessionFailure> driveInfo(const std::string& path);

std::expected<void, SessionFailure> clearDriveFirmware(const std::string& path,
                                                       bool confirm);

// Whole-file helpers shared by the command-line tool.
std::expected<Bytes, IoError> readFile(const std::string& path);
std::expected<void, IoError> writeFile(const std::string& path,
                                       std::span<const std::byte> data);

}  // namespace pm5Drive

#endif  // PM5_DRIVE_OPERATIONS_H
