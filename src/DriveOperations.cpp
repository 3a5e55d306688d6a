#include "DriveOperations.h"

#include <utility>

#include "BlockStorage.h"

namespace pm5Drive {

static SessionFailure openFailure(IoError error) {
  return SessionFailure{SessionError::IoFailure, error, {}, {}};
}

std::expected<Bytes, IoError> readFile(const std::string& path) {
  auto file = FileBlockStorage::open(path, false);
  if (!file) {
    return std::unexpected(file.error());
  }
  Bytes data(static_cast<size_t>(file->size()));
  if (auto result = file->read(0, data); !result) {
    return std::unexpected(result.error());
  }
  return data;
}

std::expected<void, IoError> writeFile(const std::string& path,
                                       std::span<const std::byte> data) {
  auto file = FileBlockStorage::create(path, data.size());
  if (!file) {
    return std::unexpected(file.error());
  }
  if (auto result = file->write(0, data); !result) {
    return result;
  }
  return file->sync();
}

std::expected<DriveLayout, InitFailure> initDrive(const std::string& path,
                                                  const InitOptions& options) {
  auto device = FileBlockStorage::open(path, true);
  if (!device) {
    return std::unexpected(InitFailure{InitError::IoFailure, device.error()});
  }

  DriveSession session;
  if (auto opened = session.open(*device); !opened) {
    return std::unexpected(
        InitFailure{InitError::IoFailure, opened.error().io});
  }
  return session.init(options);
}

std::expected<std::vector<ScanItem>, SessionFailure> listDrive(
    const std::string& path) {
  auto device = FileBlockStorage::open(path, false);
  if (!device) {
    return std::unexpected(openFailure(device.error()));
  }

  DriveSession session;
  if (auto opened = session.open(*device); !opened) {
    return std::unexpected(opened.error());
  }
  return session.listEntries();
}

std::expected<StoredEntry, SessionFailure> exportEntry(
    const std::string& path, std::optional<uint16_t> entryId) {
  auto device = FileBlockStorage::open(path, false);
  if (!device) {
    return std::unexpected(openFailure(device.error()));
  }

  DriveSession session;
  if (auto opened = session.open(*device); !opened) {
    return std::unexpected(opened.error());
  }
  if (!entryId) {
    return session.readLatestEntry();
  }
  return session.readEntry(*entryId);
}

std::expected<FlashSummary, FlashReport> flashDrive(
    const std::string& path, const std::string& firmwarePath, bool confirm,
    const FlashProgress& progress) {
  if (!confirm) {
    return std::unexpected(FlashReport{.phase = FlashPhase::Confirm,
                                       .error = FlashError::NotConfirmed});
  }

  auto image = readFile(firmwarePath);
  if (!image) {
    return std::unexpected(FlashReport{.phase = FlashPhase::Validate,
                                       .error = FlashError::InvalidImage,
                                       .io = image.error()});
  }

  auto device = FileBlockStorage::open(path, true);
  if (!device) {
    return std::unexpected(FlashReport{.phase = FlashPhase::Compatibility,
                                       .error = FlashError::NotInitialized,
                                       .io = device.error()});
  }

  DriveSession session;
  if (auto opened = session.open(*device); !opened) {
    return std::unexpected(FlashReport{.phase = FlashPhase::Compatibility,
                                       .error = FlashError::NotInitialized,
                                       .io = opened.error().io});
  }
  return session.flash(*image, confirm, progress);
}

std::expected<DriveInfo, SessionFailure> driveInfo(const std::string& path) {
  auto device = FileBlockStorage::open(path, false);
  if (!device) {
    return std::unexpected(openFailure(device.error()));
  }

  DriveSession session;
  if (auto opened = session.open(*device); !opened) {
    return std::unexpected(opened.error());
  }

  auto summary = session.summary();
  if (!summary) {
    return std::unexpected(summary.error());
  }

  DriveInfo info{
      .metadata = *session.metadata(),
      .partitionOrigin = session.partition()->origin(),
      .partitionSize = session.partition()->size(),
      .partitionType = session.partition()->typeTag(),
      .summary = std::move(*summary),
  };

  auto firmware = session.installedFirmware();
  if (firmware) {
    if (*firmware) {
      info.firmware = (*firmware)->info();
    }
  } else if (firmware.error().error == SessionError::CorruptFirmware) {
    info.firmwareError = firmware.error().format;
  } else {
    return std::unexpected(firmware.error());
  }
  return info;
}

std::expected<void, SessionFailure> clearDriveFirmware(const std::string& path,
                                                       bool confirm) {
  if (!confirm) {
    return std::unexpected(
        SessionFailure{SessionError::NotConfirmed, {}, {}, {}});
  }

  auto device = FileBlockStorage::open(path, true);
  if (!device) {
    return std::unexpected(openFailure(device.error()));
  }

  DriveSession session;
  if (auto opened = session.open(*device); !opened) {
    return std::unexpected(opened.error());
  }
  return session.clearFirmware(confirm);
}

}  // namespace pm5Drive
