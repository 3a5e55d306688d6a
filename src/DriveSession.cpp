#include "DriveSession.h"

#include <algorithm>
#include <format>
#include <print>
#include <utility>

#include "LayoutBuilder.h"

namespace pm5Drive {

// -----------------------------------------------------------------------------
// Names
// -----------------------------------------------------------------------------

const char* toString(SessionState state) {
  switch (state) {
    case SessionState::Closed: return "closed";
    case SessionState::Opened: return "opened";
    case SessionState::Scanning: return "scanning";
    case SessionState::Initializing: return "initializing";
    case SessionState::Flashing: return "flashing";
    case SessionState::Writing: return "writing";
  }
  return "unknown";
}

const char* toString(FlashPhase phase) {
  switch (phase) {
    case FlashPhase::Confirm: return "confirm";
    case FlashPhase::Validate: return "validate";
    case FlashPhase::Compatibility: return "compatibility";
    case FlashPhase::Stage: return "stage";
    case FlashPhase::Write: return "write";
    case FlashPhase::ReadBack: return "read-back";
    case FlashPhase::Verify: return "verify";
    case FlashPhase::Complete: return "complete";
  }
  return "unknown";
}

std::string FlashReport::describe() const {
  std::string text =
      std::format("flash stopped in {} phase: {}", toString(phase),
                  toString(error));
  if (format) {
    text += std::format("\n  image: {}", toString(*format));
  }
  if (incompatible) {
    text += std::format("\n  {}", toString(*incompatible));
  }
  if (imageRevision && deviceRevision) {
    text += std::format("\n  image hardware revision {}, device revision {}",
                        *imageRevision, *deviceRevision);
  }
  if (io) {
    text += std::format("\n  device: {}", toString(*io));
  }
  if (offset) {
    text += std::format("\n  offset: 0x{:08X}", *offset);
  }
  if (expectedByte && actualByte) {
    text += std::format("\n  expected byte 0x{:02X}, found 0x{:02X}",
                        *expectedByte, *actualByte);
  }
  if (expectedCrc && actualCrc) {
    text += std::format("\n  expected CRC-32 0x{:08X}, found 0x{:08X}",
                        *expectedCrc, *actualCrc);
  }
  return text;
}

namespace {

// Puts the session into `during` for one operation and restores the previous
// state on every exit path.
class StateScope {
public:
  StateScope(SessionState& state, SessionState during)
      : state_(state), previous_(std::exchange(state, during)) {}
  ~StateScope() { state_ = previous_; }

  StateScope(const StateScope&) = delete;
  StateScope& operator=(const StateScope&) = delete;

private:
  SessionState& state_;
  SessionState previous_;
};

}  // namespace

static SessionFailure ioFailure(IoError error,
                                std::optional<uint32_t> slot = {}) {
  return SessionFailure{SessionError::IoFailure, error, {}, slot};
}

// -----------------------------------------------------------------------------
// LogScanner
// -----------------------------------------------------------------------------

LogScanner::LogScanner(DriveSession& session, const DriveLayout& layout)
    : session_(&session),
      generation_(session.generation_),
      layout_(layout),
      buffer_(layout.slotSize) {}

std::expected<bool, SessionFailure> LogScanner::next(ScanItem& item) {
  if (session_->generation_ != generation_ || !session_->partition_) {
    return std::unexpected(SessionFailure{SessionError::NotOpen, {}, {}, {}});
  }
  StateScope scope(session_->state_, SessionState::Scanning);

  while (slot_ < layout_.slotCount) {
    const uint32_t slot = slot_++;
    if (auto result =
            session_->partition_->read(layout_.slotOffset(slot), buffer_);
        !result) {
      return std::unexpected(ioFailure(result.error(), slot));
    }
    if (isErasedSlot(buffer_)) {
      continue;
    }
    item.slot = slot;
    item.entry = decodeEntry(buffer_);
    return true;
  }
  return false;
}

// -----------------------------------------------------------------------------
// Open & Close
// -----------------------------------------------------------------------------

std::expected<void, SessionFailure> DriveSession::open(BlockStorage& storage) {
  close();

  auto partition = Partition::locate(storage);
  if (!partition) {
    return std::unexpected(ioFailure(partition.error()));
  }
  partition_ = *partition;
  state_ = SessionState::Opened;
  generation_++;

  std::println("[DriveSession] Partition at 0x{:X}, {} bytes (type 0x{:02X})",
               partition_->origin(), partition_->size(), partition_->typeTag());

  // A partition too small for the header is simply not initialized.
  if (partition_->size() < kMetadataOffset + kMetadataHeaderSize) {
    return {};
  }

  Bytes header(kMetadataHeaderSize);
  if (auto result = partition_->read(kMetadataOffset, header); !result) {
    close();
    return std::unexpected(ioFailure(result.error()));
  }
  reloadMetadata(header);
  return {};
}

void DriveSession::reloadMetadata(std::span<const std::byte> header) {
  metadata_.reset();
  metadataError_.reset();
  if (!hasMetadataMarker(header)) {
    return;
  }

  auto metadata = decodeMetadata(header);
  if (!metadata) {
    metadataError_ = metadata.error();
    std::println(stderr, "[DriveSession] Metadata header unreadable: {}",
                 toString(metadata.error()));
    return;
  }
  metadata_ = std::move(*metadata);
}

void DriveSession::close() {
  if (state_ != SessionState::Closed) {
    generation_++;
  }
  partition_.reset();
  metadata_.reset();
  metadataError_.reset();
  state_ = SessionState::Closed;
}

std::expected<void, SessionFailure> DriveSession::requireInitialized() const {
  if (!isOpen()) {
    return std::unexpected(SessionFailure{SessionError::NotOpen, {}, {}, {}});
  }
  if (!metadata_) {
    return std::unexpected(
        SessionFailure{SessionError::NotInitialized, {}, metadataError_, {}});
  }
  return {};
}

// -----------------------------------------------------------------------------
// Initialization
// -----------------------------------------------------------------------------

std::expected<DriveLayout, InitFailure> DriveSession::init(
    const InitOptions& options) {
  if (!isOpen()) {
    return std::unexpected(
        InitFailure{InitError::IoFailure, IoError::InvalidDevice});
  }
  StateScope scope(state_, SessionState::Initializing);

  const auto createdAt = options.createdAt.value_or(
      std::chrono::floor<std::chrono::seconds>(
          std::chrono::system_clock::now()));
  auto builder = LayoutBuilder::make(*partition_, options.user,
                                     options.hardwareRevision, createdAt);

  auto layout = builder.initialize(options.force);
  if (layout) {
    metadata_ = builder.metadata();
    metadataError_.reset();
  }
  return layout;
}

// -----------------------------------------------------------------------------
// Scanning
// -----------------------------------------------------------------------------

std::expected<LogScanner, SessionFailure> DriveSession::scan() {
  if (auto ready = requireInitialized(); !ready) {
    return std::unexpected(ready.error());
  }
  return LogScanner(*this, metadata_->layout);
}

std::expected<std::vector<ScanItem>, SessionFailure>
DriveSession::listEntries() {
  auto scanner = scan();
  if (!scanner) {
    return std::unexpected(scanner.error());
  }
  StateScope scope(state_, SessionState::Scanning);

  std::vector<ScanItem> items;
  ScanItem item;
  while (true) {
    auto more = scanner->next(item);
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) {
      break;
    }
    if (!item.entry) {
      std::println(stderr, "[DriveSession] Slot {} is corrupt: {}", item.slot,
                   toString(item.entry.error().reason));
    }
    items.push_back(std::move(item));
  }
  return items;
}

std::expected<StoredEntry, SessionFailure> DriveSession::readEntry(
    uint16_t entryId) {
  auto scanner = scan();
  if (!scanner) {
    return std::unexpected(scanner.error());
  }
  StateScope scope(state_, SessionState::Scanning);

  std::optional<SessionFailure> corrupt;
  ScanItem item;
  while (true) {
    auto more = scanner->next(item);
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) {
      break;
    }
    if (item.entry) {
      if (item.entry->entryId == entryId) {
        const auto raw = scanner->slotBytes();
        return StoredEntry{item.slot, std::move(*item.entry),
                           Bytes(raw.begin(), raw.end())};
      }
    } else if (!corrupt && item.entry.error().entryId == entryId) {
      corrupt = SessionFailure{SessionError::CorruptEntry, {},
                               item.entry.error().reason, item.slot};
    }
  }

  if (corrupt) {
    return std::unexpected(*corrupt);
  }
  return std::unexpected(
      SessionFailure{SessionError::EntryNotFound, {}, {}, {}});
}

std::expected<StoredEntry, SessionFailure> DriveSession::readLatestEntry() {
  auto scanner = scan();
  if (!scanner) {
    return std::unexpected(scanner.error());
  }
  StateScope scope(state_, SessionState::Scanning);

  std::optional<StoredEntry> latest;
  ScanItem item;
  while (true) {
    auto more = scanner->next(item);
    if (!more) {
      return std::unexpected(more.error());
    }
    if (!*more) {
      break;
    }
    if (!item.entry) {
      continue;
    }
    if (!latest || item.entry->startTime >= latest->entry.startTime) {
      const auto raw = scanner->slotBytes();
      latest = StoredEntry{item.slot, std::move(*item.entry),
                           Bytes(raw.begin(), raw.end())};
    }
  }

  if (!latest) {
    return std::unexpected(
        SessionFailure{SessionError::EntryNotFound, {}, {}, {}});
  }
  return std::move(*latest);
}

// -----------------------------------------------------------------------------
// Writing Entries
// -----------------------------------------------------------------------------

std::expected<uint32_t, SessionFailure> DriveSession::writeEntry(
    const WorkoutLogEntry& entry, std::optional<uint32_t> slot) {
  if (auto ready = requireInitialized(); !ready) {
    return std::unexpected(ready.error());
  }
  StateScope scope(state_, SessionState::Writing);
  const DriveLayout layout = metadata_->layout;

  if (slot && *slot >= layout.slotCount) {
    return std::unexpected(
        SessionFailure{SessionError::SlotOutOfRange, {}, {}, *slot});
  }

  auto encoded = encodeEntry(entry);
  if (!encoded) {
    return std::unexpected(
        SessionFailure{SessionError::EncodeFailed, {}, encoded.error(), {}});
  }

  Bytes buffer(layout.slotSize);
  if (!slot) {
    for (uint32_t i = 0; i < layout.slotCount; i++) {
      if (auto result = partition_->read(layout.slotOffset(i), buffer);
          !result) {
        return std::unexpected(ioFailure(result.error(), i));
      }
      if (isErasedSlot(buffer)) {
        slot = i;
        break;
      }
    }
    if (!slot) {
      return std::unexpected(SessionFailure{SessionError::LogFull, {}, {}, {}});
    }
  }

  const uint32_t target = *slot;
  const uint64_t offset = layout.slotOffset(target);
  if (auto result = partition_->write(offset, *encoded); !result) {
    return std::unexpected(ioFailure(result.error(), target));
  }
  if (auto result = partition_->sync(); !result) {
    return std::unexpected(ioFailure(result.error(), target));
  }

  buffer.resize(encoded->size());
  if (auto result = partition_->read(offset, buffer); !result) {
    return std::unexpected(ioFailure(result.error(), target));
  }
  if (buffer != *encoded) {
    std::println(stderr, "[DriveSession] Slot {} read-back differs", target);
    return std::unexpected(
        SessionFailure{SessionError::VerificationFailed, {}, {}, target});
  }
  if (auto decoded = decodeEntry(buffer); !decoded) {
    return std::unexpected(SessionFailure{SessionError::VerificationFailed, {},
                                          decoded.error().reason, target});
  }

  std::println("[DriveSession] Wrote entry {} to slot {}", entry.entryId,
               target);
  return target;
}

// -----------------------------------------------------------------------------
// Firmware
// -----------------------------------------------------------------------------

std::expected<FlashSummary, FlashReport> DriveSession::flash(
    std::span<const std::byte> imageBytes, bool confirm,
    const FlashProgress& progress) {
  if (!confirm) {
    return std::unexpected(
        FlashReport{.phase = FlashPhase::Confirm,
                    .error = FlashError::NotConfirmed});
  }

  std::println("[DriveSession] Validating firmware image ({} bytes)...",
               imageBytes.size());
  auto image = FirmwareImage::load(imageBytes);
  if (!image) {
    return std::unexpected(FlashReport{.phase = FlashPhase::Validate,
                                       .error = FlashError::InvalidImage,
                                       .format = image.error()});
  }

  if (!isOpen() || !metadata_) {
    return std::unexpected(FlashReport{.phase = FlashPhase::Compatibility,
                                       .error = FlashError::NotInitialized});
  }
  const uint16_t deviceRevision = metadata_->hardwareRevision;
  if (auto compatible = verifyCompatible(*image, deviceRevision);
      !compatible) {
    return std::unexpected(
        FlashReport{.phase = FlashPhase::Compatibility,
                    .error = FlashError::Incompatible,
                    .incompatible = compatible.error(),
                    .imageRevision = image->hardwareRevision(),
                    .deviceRevision = deviceRevision});
  }

  auto staged = image->stage(metadata_->layout);
  if (!staged) {
    return std::unexpected(FlashReport{
        .phase = FlashPhase::Stage,
        .error = staged.error(),
        .offset = uint64_t{metadata_->layout.firmwareSlot.offset}});
  }

  StateScope scope(state_, SessionState::Flashing);
  std::println("[DriveSession] Flashing firmware {} to 0x{:X} ({} bytes)...",
               image->versionString(), staged->offset, staged->bytes.size());

  if (auto written = writeSlot(*staged, progress); !written) {
    return std::unexpected(written.error());
  }
  if (auto verified = verifySlot(*staged, progress); !verified) {
    return std::unexpected(verified.error());
  }

  if (progress) {
    progress(FlashPhase::Complete, staged->bytes.size(), staged->bytes.size());
  }
  std::println("[DriveSession] Firmware verified.");
  return FlashSummary{
      .firmware = image->info(),
      .offset = staged->offset,
      .length = staged->bytes.size(),
      .crc = image->imageCrc(),
  };
}

std::expected<void, FlashReport> DriveSession::writeSlot(
    const SlotWrite& write, const FlashProgress& progress) {
  const uint64_t total = write.bytes.size();
  uint64_t done = 0;
  while (done < total) {
    const size_t chunk =
        static_cast<size_t>(std::min<uint64_t>(total - done, kTransferChunkSize));
    if (auto result = partition_->write(write.offset + done,
                                        write.bytes.subspan(done, chunk));
        !result) {
      return std::unexpected(FlashReport{.phase = FlashPhase::Write,
                                         .error = FlashError::WriteFailed,
                                         .io = result.error(),
                                         .offset = write.offset + done});
    }
    done += chunk;
    if (progress) {
      progress(FlashPhase::Write, done, total);
    }
  }

  if (auto result = partition_->sync(); !result) {
    return std::unexpected(FlashReport{.phase = FlashPhase::Write,
                                       .error = FlashError::WriteFailed,
                                       .io = result.error()});
  }
  return {};
}

std::expected<void, FlashReport> DriveSession::verifySlot(
    const SlotWrite& write, const FlashProgress& progress) {
  const uint64_t total = write.bytes.size();
  Bytes readBack(total);
  uint64_t done = 0;
  while (done < total) {
    const size_t chunk =
        static_cast<size_t>(std::min<uint64_t>(total - done, kTransferChunkSize));
    if (auto result = partition_->read(
            write.offset + done, std::span{readBack}.subspan(done, chunk));
        !result) {
      return std::unexpected(FlashReport{.phase = FlashPhase::ReadBack,
                                         .error = FlashError::ReadBackFailed,
                                         .io = result.error(),
                                         .offset = write.offset + done});
    }
    done += chunk;
    if (progress) {
      progress(FlashPhase::ReadBack, done, total);
    }
  }

  const uint32_t expectedCrc = codec::crc32(write.bytes);
  const uint32_t actualCrc = codec::crc32(readBack);
  auto [wanted, found] =
      std::mismatch(write.bytes.begin(), write.bytes.end(), readBack.begin());
  if (progress) {
    progress(FlashPhase::Verify, total, total);
  }
  if (wanted == write.bytes.end() && expectedCrc == actualCrc) {
    return {};
  }

  FlashReport report{.phase = FlashPhase::Verify,
                     .error = FlashError::VerificationFailed,
                     .expectedCrc = expectedCrc,
                     .actualCrc = actualCrc};
  if (wanted != write.bytes.end()) {
    report.offset =
        write.offset + static_cast<uint64_t>(wanted - write.bytes.begin());
    report.expectedByte = std::to_integer<uint8_t>(*wanted);
    report.actualByte = std::to_integer<uint8_t>(*found);
  }
  std::println(stderr, "[DriveSession] {}", report.describe());
  return std::unexpected(report);
}

std::expected<std::optional<FirmwareImage>, SessionFailure>
DriveSession::installedFirmware() {
  if (auto ready = requireInitialized(); !ready) {
    return std::unexpected(ready.error());
  }
  StateScope scope(state_, SessionState::Scanning);
  const Region slot = metadata_->layout.firmwareSlot;

  Bytes header(kFirmwareHeaderSize);
  if (auto result = partition_->read(slot.offset, header); !result) {
    return std::unexpected(ioFailure(result.error()));
  }
  if (codec::allBytesEqual(header, kErasedByte)) {
    return std::optional<FirmwareImage>{};
  }

  const uint32_t payloadLength =
      codec::decodeField(header, kFirmwareHeaderFields.payloadLength,
                         kFirmwareEndian)
          .value_or(0);
  const uint64_t length = uint64_t{kFirmwareHeaderSize} + payloadLength;
  if (length > slot.size) {
    return std::unexpected(SessionFailure{SessionError::CorruptFirmware, {},
                                          FormatError::LengthMismatch, {}});
  }

  Bytes image(static_cast<size_t>(length));
  if (auto result = partition_->read(slot.offset, image); !result) {
    return std::unexpected(ioFailure(result.error()));
  }
  auto loaded = FirmwareImage::load(image);
  if (!loaded) {
    return std::unexpected(
        SessionFailure{SessionError::CorruptFirmware, {}, loaded.error(), {}});
  }
  return std::optional<FirmwareImage>{std::move(*loaded)};
}

std::expected<void, SessionFailure> DriveSession::clearFirmware(bool confirm) {
  if (!confirm) {
    return std::unexpected(
        SessionFailure{SessionError::NotConfirmed, {}, {}, {}});
  }
  if (auto ready = requireInitialized(); !ready) {
    return std::unexpected(ready.error());
  }
  StateScope scope(state_, SessionState::Flashing);
  const Region slot = metadata_->layout.firmwareSlot;

  std::println("[DriveSession] Erasing firmware slot...");
  if (auto result = partition_->fill(slot.offset, slot.size, kErasedByte);
      !result) {
    return std::unexpected(ioFailure(result.error()));
  }
  if (auto result = partition_->sync(); !result) {
    return std::unexpected(ioFailure(result.error()));
  }

  Bytes buffer(kTransferChunkSize);
  for (uint64_t done = 0; done < slot.size; done += buffer.size()) {
    buffer.resize(
        static_cast<size_t>(std::min<uint64_t>(slot.size - done, buffer.size())));
    if (auto result = partition_->read(slot.offset + done, buffer); !result) {
      return std::unexpected(ioFailure(result.error()));
    }
    if (!codec::allBytesEqual(buffer, kErasedByte)) {
      return std::unexpected(
          SessionFailure{SessionError::VerificationFailed, {}, {}, {}});
    }
  }
  return {};
}

// -----------------------------------------------------------------------------
// Drive Information
// -----------------------------------------------------------------------------

std::expected<UserProfile, SessionFailure> DriveSession::user() const {
  if (auto ready = requireInitialized(); !ready) {
    return std::unexpected(ready.error());
  }
  return metadata_->user;
}

std::expected<DriveSummary, SessionFailure> DriveSession::summary() {
  auto items = listEntries();
  if (!items) {
    return std::unexpected(items.error());
  }

  DriveSummary summary{.user = metadata_->user,
                       .hardwareRevision = metadata_->hardwareRevision};
  for (const ScanItem& item : *items) {
    if (!item.entry) {
      summary.corruptCount++;
      continue;
    }
    const WorkoutLogEntry& entry = *item.entry;
    const double seconds = entry.totalDurationTenths / 10.0;
    const double power = watts(entry);

    summary.entryCount++;
    summary.lifetimeMeters += entry.totalDistanceMeters;
    summary.lifetimeKwh += power * seconds / 3'600'000.0;
    summary.lifetimeKcal += caloriesPerHour(power) * seconds / 3600.0;
    if (!summary.firstWorkout || entry.startTime < *summary.firstWorkout) {
      summary.firstWorkout = entry.startTime;
    }
    if (!summary.lastWorkout || entry.startTime > *summary.lastWorkout) {
      summary.lastWorkout = entry.startTime;
    }
  }
  return summary;
}

}  // namespace pm5Drive
