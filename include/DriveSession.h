// =============================================================================
// DriveSession.h
// =============================================================================
//
// Orchestration of every read and write against one open drive.
//
// State Machine
// -------------
//
//   Closed ──open()──► Opened ──► { Scanning | Initializing | Flashing |
//                        ▲          Writing }
//                        └───────────────┘ (operation returns)
//   Opened ──close()──► Closed
//
// Operations run to completion before returning. None of them can be
// cancelled; a half-written firmware slot is worse than a slow one.
//
// Flash Pipeline
// --------------
// flash() is a sequence of safety gates. Each gate has its own failure and
// no byte reaches the firmware slot before Validate and Compatibility pass:
//
//   Confirm → Validate → Compatibility → Stage → Write → ReadBack → Verify
//
// A failure after Write started leaves the slot in an undefined state. That
// risk cannot be removed, only detected; the FlashReport says which phase was
// reached and where the bytes diverged.
//
// Ownership
// ---------
// The session borrows a BlockStorage from its caller and never owns it. The
// only state kept between calls is the metadata read at open() (refreshed by
// init()).
//
// =============================================================================

#ifndef PM5_DRIVE_SESSION_H
#define PM5_DRIVE_SESSION_H

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "BlockStorage.h"
#include "DriveLayout.h"
#include "DriveResult.h"
#include "FirmwareImage.h"
#include "WorkoutRecord.h"

namespace pm5Drive {

enum class SessionState {
  Closed,
  Opened,
  Scanning,
  Initializing,
  Flashing,
  Writing
};

enum class FlashPhase {
  Confirm,
  Validate,
  Compatibility,
  Stage,
  Write,
  ReadBack,
  Verify,
  Complete
};

const char* toString(SessionState state);
const char* toString(FlashPhase phase);

// Chunk size of every bulk read and write issued by the session.
static constexpr uint32_t kTransferChunkSize = 64 * 1024;

// -----------------------------------------------------------------------------
// Operation Results
// -----------------------------------------------------------------------------

struct InitOptions {
  UserProfile user;
  uint16_t hardwareRevision = 0;
  bool force = false;
  // Current time when empty.
  std::optional<std::chrono::sys_seconds> createdAt;
};

struct ScanItem {
  uint32_t slot = 0;
  std::expected<WorkoutLogEntry, CorruptEntry> entry;
};

struct StoredEntry {
  uint32_t slot;
  WorkoutLogEntry entry;
  Bytes raw;
};

/**
 * @brief Everything known about a failed flash.
 *
 * Only the fields relevant to the failing phase are set.
 */
struct FlashReport {
  FlashPhase phase;
  FlashError error;
  std::optional<FormatError> format;
  std::optional<IoError> io;
  std::optional<IncompatibleError> incompatible;
  std::optional<uint64_t> offset;  // partition-relative
  std::optional<uint8_t> expectedByte;
  std::optional<uint8_t> actualByte;
  std::optional<uint32_t> expectedCrc;
  std::optional<uint32_t> actualCrc;
  std::optional<uint16_t> imageRevision;
  std::optional<uint16_t> deviceRevision;

  std::string describe() const;
};

struct FlashSummary {
  FirmwareInfo firmware;
  uint64_t offset;
  uint64_t length;
  uint32_t crc;
};

// Called with the phase and the bytes done out of the total for that phase.
using FlashProgress =
    std::function<void(FlashPhase phase, uint64_t done, uint64_t total)>;

struct DriveSummary {
  UserProfile user;
  uint16_t hardwareRevision = 0;
  uint32_t entryCount = 0;
  uint32_t corruptCount = 0;
  uint64_t lifetimeMeters = 0;
  double lifetimeKwh = 0.0;
  double lifetimeKcal = 0.0;
  std::optional<std::chrono::sys_seconds> firstWorkout;
  std::optional<std::chrono::sys_seconds> lastWorkout;
};

// -----------------------------------------------------------------------------
// LogScanner
// -----------------------------------------------------------------------------

class DriveSession;

/**
 * @brief Lazy pass over the workout slot table.
 *
 * Erased slots are skipped. Each other slot yields exactly one ScanItem,
 * either a decoded entry or the reason it could not be trusted. The pass
 * ends after the last slot; rewind() starts it again from slot 0.
 *
 * A scanner is bound to the open() that produced it. Once its session is
 * closed or reopened, next() fails with NotOpen. It must not outlive the
 * session itself.
 */
class LogScanner {
public:
  // false once the table is exhausted. A device read failure ends the pass.
  std::expected<bool, SessionFailure> next(ScanItem& item);
  void rewind() { slot_ = 0; }

  uint32_t position() const { return slot_; }
  // Raw bytes of the slot last returned by next().
  std::span<const std::byte> slotBytes() const { return buffer_; }

private:
  friend class DriveSession;
  LogScanner(DriveSession& session, const DriveLayout& layout);

  DriveSession* session_;
  uint64_t generation_;
  DriveLayout layout_;
  uint32_t slot_ = 0;
  Bytes buffer_;
};

// -----------------------------------------------------------------------------
// DriveSession
// -----------------------------------------------------------------------------

class DriveSession {
public:
  DriveSession() = default;
  DriveSession(const DriveSession&) = delete;
  DriveSession& operator=(const DriveSession&) = delete;

  // Locates the partition and reads the metadata region. An unrecognized
  // partition opens fine with isInitialized() false.
  std::expected<void, SessionFailure> open(BlockStorage& storage);
  void close();

  SessionState state() const { return state_; }
  bool isOpen() const { return state_ != SessionState::Closed; }
  bool isInitialized() const { return metadata_.has_value(); }
  const std::optional<DriveMetadata>& metadata() const { return metadata_; }
  const std::optional<Partition>& partition() const { return partition_; }

  // Set when the marker is present but the header failed to decode.
  std::optional<FormatError> metadataError() const { return metadataError_; }

  std::expected<DriveLayout, InitFailure> init(const InitOptions& options);

  // Scanning
  std::expected<LogScanner, SessionFailure> scan();
  std::expected<std::vector<ScanItem>, SessionFailure> listEntries();
  std::expected<StoredEntry, SessionFailure> readEntry(uint16_t entryId);
  // The decodable entry with the newest start time; the later slot wins a
  // tie. Corrupt slots are passed over.
  std::expected<StoredEntry, SessionFailure> readLatestEntry();

  // Writes into `slot`, or the first erased slot when empty. Returns the slot
  // used once the read-back matched and decoded.
  std::expected<uint32_t, SessionFailure> writeEntry(
      const WorkoutLogEntry& entry, std::optional<uint32_t> slot = {});

  // Firmware
  std::expected<FlashSummary, FlashReport> flash(
      std::span<const std::byte> imageBytes, bool confirm,
      const FlashProgress& progress = {});
  std::expected<std::optional<FirmwareImage>, SessionFailure>
  installedFirmware();
  std::expected<void, SessionFailure> clearFirmware(bool confirm);

  std::expected<UserProfile, SessionFailure> user() const;
  std::expected<DriveSummary, SessionFailure> summary();

private:
  friend class LogScanner;

  std::expected<void, SessionFailure> requireInitialized() const;
  std::expected<void, FlashReport> writeSlot(const SlotWrite& write,
                                             const FlashProgress& progress);
  std::expected<void, FlashReport> verifySlot(const SlotWrite& write,
                                              const FlashProgress& progress);
  void reloadMetadata(std::span<const std::byte> header);

  SessionState state_ = SessionState::Closed;
  std::optional<Partition> partition_;
  std::optional<DriveMetadata> metadata_;
  std::optional<FormatError> metadataError_;
  // Bumped by every open() and close().
  uint64_t generation_ = 0;
};

}  // namespace pm5Drive

#endif  // PM5_DRIVE_SESSION_H
