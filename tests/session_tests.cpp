#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "DriveSession.h"
#include "MemoryStorage.h"
#include "SampleEntries.h"
#include "TestSupport.h"

using namespace pm5Drive;
using namespace pm5DriveTest;

static constexpr uint64_t kDriveSize = 4 * 1024 * 1024;
static constexpr uint16_t kDeviceRevision = 3;

static InitOptions sampleOptions() {
  return InitOptions{
      .user = {"ANNA", 7},
      .hardwareRevision = kDeviceRevision,
      .force = false,
      .createdAt = at(2024, 3, 1, 9),
  };
}

static bool openInitialized(MemoryStorage& storage, DriveSession& session) {
  return session.open(storage) && session.init(sampleOptions()) &&
         session.isInitialized();
}

static Bytes firmwareImage(uint16_t hardwareRevision, size_t payloadSize) {
  Bytes payload(payloadSize);
  for (size_t i = 0; i < payloadSize; i++) {
    payload[i] = static_cast<std::byte>((i * 13 + 1) & 0xFF);
  }
  FirmwareInfo info{
      .versionMajor = 33,
      .versionMinor = 5,
      .hardwareRevision = hardwareRevision,
      .versionText = "PM5 v33",
      .buildTime = at(2024, 5, 1),
  };
  return FirmwareImage::package(info, payload).value_or(Bytes{});
}

static void placeEntry(MemoryStorage& storage, uint32_t slot,
                       std::span<const std::byte> bytes) {
  std::copy(bytes.begin(), bytes.end(),
            storage.bytes().begin() +
                static_cast<ptrdiff_t>(
                    DriveLayout::standard().slotOffset(slot)));
}

// -----------------------------------------------------------------------------
// Open & Init
// -----------------------------------------------------------------------------

static bool testOpenBlankDrive() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(session.state() == SessionState::Closed)) return false;

  if (!expect(session.open(storage))) return false;
  if (!expect(session.isOpen())) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  if (!expect(!session.isInitialized())) return false;
  if (!expect(!session.metadataError())) return false;
  if (!expect(session.partition()->origin() == 0)) return false;
  if (!expect(session.partition()->size() == kDriveSize)) return false;

  if (!expect(session.listEntries().error().error == SessionError::NotInitialized)) return false;
  if (!expect(session.user().error().error == SessionError::NotInitialized)) return false;

  session.close();
  if (!expect(session.state() == SessionState::Closed)) return false;
  if (!expect(!session.partition())) return false;
  return true;
}

static bool testClosedSessionRefuses() {
  DriveSession session;
  if (!expect(session.listEntries().error().error == SessionError::NotOpen)) return false;
  if (!expect(session.readEntry(1).error().error == SessionError::NotOpen)) return false;
  if (!expect(session.writeEntry(distanceWorkout(1)).error().error ==
              SessionError::NotOpen)) return false;
  if (!expect(session.installedFirmware().error().error == SessionError::NotOpen)) return false;
  if (!expect(session.clearFirmware(true).error().error == SessionError::NotOpen)) return false;
  if (!expect(session.clearFirmware(false).error().error ==
              SessionError::NotConfirmed)) return false;
  if (!expect(session.summary().error().error == SessionError::NotOpen)) return false;

  auto init = session.init(sampleOptions());
  if (!expect(!init)) return false;
  if (!expect(init.error().error == InitError::IoFailure)) return false;
  if (!expect(init.error().io == IoError::InvalidDevice)) return false;

  auto flashed = session.flash(firmwareImage(kDeviceRevision, 100), true);
  if (!expect(!flashed)) return false;
  if (!expect(flashed.error().phase == FlashPhase::Compatibility)) return false;
  if (!expect(flashed.error().error == FlashError::NotInitialized)) return false;
  return true;
}

static bool testInitThenReopen() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  if (!expect(session.user() == (UserProfile{"ANNA", 7}))) return false;

  DriveSession reopened;
  if (!expect(reopened.open(storage))) return false;
  if (!expect(reopened.isInitialized())) return false;
  if (!expect(*reopened.metadata() == *session.metadata())) return false;
  if (!expect(reopened.metadata()->hardwareRevision == kDeviceRevision)) return false;
  if (!expect(reopened.metadata()->createdAt == at(2024, 3, 1, 9))) return false;

  auto again = reopened.init(sampleOptions());
  if (!expect(!again)) return false;
  if (!expect(again.error().error == InitError::AlreadyInitialized)) return false;
  if (!expect(reopened.state() == SessionState::Opened)) return false;
  return true;
}

static bool testForcedInitClearsLog() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  if (!expect(session.writeEntry(distanceWorkout(1)))) return false;

  InitOptions options = sampleOptions();
  options.user = {"BOB", 8};
  options.force = true;
  if (!expect(session.init(options))) return false;
  if (!expect(session.user()->name == "BOB")) return false;
  if (!expect(session.listEntries()->empty())) return false;
  return true;
}

static bool testTooSmallDrive() {
  MemoryStorage tiny(100);
  DriveSession session;
  if (!expect(session.open(tiny))) return false;
  if (!expect(!session.isInitialized())) return false;

  MemoryStorage small(1024 * 1024);
  if (!expect(session.open(small))) return false;
  auto init = session.init(sampleOptions());
  if (!expect(!init)) return false;
  if (!expect(init.error().error == InitError::PartitionTooSmall)) return false;
  if (!expect(small.writeCount() == 0)) return false;
  return true;
}

static bool testDamagedHeader() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  storage.bytes()[kMetadataFields.userId.offset] ^= std::byte{0x01};

  DriveSession reopened;
  if (!expect(reopened.open(storage))) return false;
  if (!expect(!reopened.isInitialized())) return false;
  if (!expect(reopened.metadataError() == FormatError::ChecksumMismatch)) return false;

  auto listed = reopened.listEntries();
  if (!expect(!listed)) return false;
  if (!expect(listed.error().error == SessionError::NotInitialized)) return false;
  if (!expect(listed.error().format == FormatError::ChecksumMismatch)) return false;

  // The marker still protects the log from an unforced init.
  storage.resetCounters();
  auto init = reopened.init(sampleOptions());
  if (!expect(!init)) return false;
  if (!expect(init.error().error == InitError::AlreadyInitialized)) return false;
  if (!expect(storage.writeCount() == 0)) return false;
  return true;
}

// -----------------------------------------------------------------------------
// Workout Log
// -----------------------------------------------------------------------------

static bool testListMixedSlots() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  const auto first = encodeEntry(distanceWorkout(1));
  const auto second = encodeEntry(intervalWorkout(2));
  const auto third = encodeEntry(distanceWorkout(3));
  if (!expect(first && second && third)) return false;
  placeEntry(storage, 0, *first);
  placeEntry(storage, 1, *second);
  placeEntry(storage, 2, Bytes(kSlotSize, std::byte{0}));
  placeEntry(storage, 3, *third);

  auto items = session.listEntries();
  if (!expect(items)) return false;
  if (!expect(items->size() == 4)) return false;
  for (uint32_t i = 0; i < 4; i++) {
    if (!expect((*items)[i].slot == i)) return false;
  }
  if (!expect((*items)[0].entry && (*items)[0].entry->entryId == 1)) return false;
  if (!expect((*items)[1].entry && *(*items)[1].entry == intervalWorkout(2))) return false;
  if (!expect(!(*items)[2].entry)) return false;
  if (!expect((*items)[2].entry.error().reason == FormatError::ChecksumMismatch)) return false;
  if (!expect((*items)[3].entry && (*items)[3].entry->entryId == 3)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;

  auto stored = session.readEntry(2);
  if (!expect(stored)) return false;
  if (!expect(stored->slot == 1)) return false;
  if (!expect(stored->entry == intervalWorkout(2))) return false;
  if (!expect(stored->raw == *second)) return false;

  if (!expect(session.readEntry(99).error().error == SessionError::EntryNotFound)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

static bool testReadCorruptEntry() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  auto slot = encodeEntry(distanceWorkout(7));
  if (!expect(slot)) return false;
  (*slot)[100] ^= std::byte{0x40};
  placeEntry(storage, 5, *slot);

  auto read = session.readEntry(7);
  if (!expect(!read)) return false;
  if (!expect(read.error().error == SessionError::CorruptEntry)) return false;
  if (!expect(read.error().format == FormatError::ChecksumMismatch)) return false;
  if (!expect(read.error().slot == uint32_t{5})) return false;
  return true;
}

static bool testReadLatestEntry() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  if (!expect(session.readLatestEntry().error().error ==
              SessionError::EntryNotFound)) return false;

  WorkoutLogEntry newest = distanceWorkout(3);
  newest.startTime = at(2024, 6, 2, 8);
  WorkoutLogEntry older = distanceWorkout(4);
  older.startTime = at(2024, 6, 1, 8);
  if (!expect(session.writeEntry(newest, 2))) return false;
  if (!expect(session.writeEntry(older, 9))) return false;

  // A damaged slot never wins, however new its start time.
  WorkoutLogEntry damaged = distanceWorkout(5);
  damaged.startTime = at(2025, 1, 1);
  auto slot = encodeEntry(damaged);
  if (!expect(slot)) return false;
  (*slot)[100] ^= std::byte{0x40};
  placeEntry(storage, 12, *slot);

  auto latest = session.readLatestEntry();
  if (!expect(latest)) return false;
  if (!expect(latest->entry.entryId == 3)) return false;
  if (!expect(latest->slot == 2)) return false;
  if (!expect(latest->raw.size() == kSlotSize)) return false;

  // Equal start times go to the later slot.
  WorkoutLogEntry twin = distanceWorkout(6);
  twin.startTime = newest.startTime;
  if (!expect(session.writeEntry(twin, 20))) return false;
  auto tie = session.readLatestEntry();
  if (!expect(tie)) return false;
  if (!expect(tie->entry.entryId == 6)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

static bool testScannerRewinds() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  if (!expect(session.writeEntry(distanceWorkout(1)))) return false;
  if (!expect(session.writeEntry(distanceWorkout(2), 40))) return false;

  auto scanner = session.scan();
  if (!expect(scanner)) return false;

  ScanItem item;
  if (!expect(scanner->next(item) == true)) return false;
  if (!expect(item.slot == 0)) return false;
  if (!expect(scanner->next(item) == true)) return false;
  if (!expect(item.slot == 40)) return false;
  if (!expect(scanner->position() == 41)) return false;
  if (!expect(scanner->next(item) == false)) return false;
  if (!expect(scanner->position() == kSlotCount)) return false;

  scanner->rewind();
  if (!expect(scanner->next(item) == true)) return false;
  if (!expect(item.slot == 0)) return false;
  if (!expect(item.entry->entryId == 1)) return false;
  return true;
}

static bool testScannerBoundToItsOpen() {
  MemoryStorage storage(kDriveSize);
  MemoryStorage other(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  if (!expect(session.writeEntry(distanceWorkout(1)))) return false;

  auto scanner = session.scan();
  if (!expect(scanner)) return false;
  ScanItem item;
  if (!expect(scanner->next(item) == true)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;

  session.close();
  storage.resetCounters();
  auto afterClose = scanner->next(item);
  if (!expect(!afterClose)) return false;
  if (!expect(afterClose.error().error == SessionError::NotOpen)) return false;
  if (!expect(storage.readCount() == 0)) return false;

  // Reopening, even on the same storage, does not revive an old scanner.
  if (!expect(session.open(storage))) return false;
  auto afterReopen = scanner->next(item);
  if (!expect(!afterReopen)) return false;
  if (!expect(afterReopen.error().error == SessionError::NotOpen)) return false;

  if (!expect(session.open(other))) return false;
  other.resetCounters();
  if (!expect(scanner->next(item).error().error == SessionError::NotOpen)) return false;
  if (!expect(other.readCount() == 0)) return false;
  return true;
}

static bool testWriteEntryRoundTrip() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  if (!expect(session.writeEntry(distanceWorkout(10)) == uint32_t{0})) return false;
  if (!expect(session.writeEntry(intervalWorkout(11)) == uint32_t{1})) return false;
  if (!expect(session.writeEntry(distanceWorkout(12), 7) == uint32_t{7})) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;

  auto stored = session.readEntry(10);
  if (!expect(stored)) return false;
  if (!expect(stored->slot == 0)) return false;
  if (!expect(stored->entry == distanceWorkout(10))) return false;
  if (!expect(stored->entry.totalDistanceMeters == 2000)) return false;
  if (!expect(stored->raw == encodeEntry(distanceWorkout(10)).value())) return false;

  if (!expect(session.listEntries()->size() == 3)) return false;
  // The next free slot skips the occupied ones.
  if (!expect(session.writeEntry(distanceWorkout(13)) == uint32_t{2})) return false;
  return true;
}

static bool testWriteEntryRejections() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  storage.resetCounters();

  auto outOfRange = session.writeEntry(distanceWorkout(1), kSlotCount);
  if (!expect(!outOfRange)) return false;
  if (!expect(outOfRange.error().error == SessionError::SlotOutOfRange)) return false;
  if (!expect(outOfRange.error().slot == uint32_t{kSlotCount})) return false;

  WorkoutLogEntry bad = distanceWorkout(1);
  bad.formatVersion = 9;
  auto encodeFailed = session.writeEntry(bad);
  if (!expect(!encodeFailed)) return false;
  if (!expect(encodeFailed.error().error == SessionError::EncodeFailed)) return false;
  if (!expect(encodeFailed.error().format == FormatError::UnsupportedVersion)) return false;
  if (!expect(storage.writeCount() == 0)) return false;

  auto full = encodeEntry(distanceWorkout(1));
  if (!expect(full)) return false;
  for (uint32_t slot = 0; slot < kSlotCount; slot++) {
    placeEntry(storage, slot, *full);
  }
  auto logFull = session.writeEntry(distanceWorkout(2));
  if (!expect(!logFull)) return false;
  if (!expect(logFull.error().error == SessionError::LogFull)) return false;
  if (!expect(storage.writeCount() == 0)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

static bool testWriteEntryReadBackMismatch() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  storage.corruptWritesAt(DriveLayout::standard().slotOffset(0) + 100);
  auto written = session.writeEntry(distanceWorkout(1));
  if (!expect(!written)) return false;
  if (!expect(written.error().error == SessionError::VerificationFailed)) return false;
  if (!expect(written.error().slot == uint32_t{0})) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

// -----------------------------------------------------------------------------
// Firmware
// -----------------------------------------------------------------------------

static bool testFlashHappyPath() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  const Bytes image = firmwareImage(kDeviceRevision, 200000);
  if (!expect(!image.empty())) return false;
  storage.resetCounters();

  std::vector<FlashPhase> phases;
  uint64_t lastWriteDone = 0;
  auto summary = session.flash(
      image, true, [&](FlashPhase phase, uint64_t done, uint64_t) {
        phases.push_back(phase);
        if (phase == FlashPhase::Write) {
          lastWriteDone = done;
        }
      });
  if (!expect(summary)) return false;
  if (!expect(summary->offset == kFirmwareSlotOffset)) return false;
  if (!expect(summary->length == image.size())) return false;
  if (!expect(summary->crc == codec::crc32(image))) return false;
  if (!expect(summary->firmware.versionMajor == 33)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;

  if (!expect(std::ranges::equal(storage.bytes(kFirmwareSlotOffset, image.size()),
                                 image))) return false;
  // 200064 bytes go out in four chunks.
  if (!expect(storage.writeCount() == 4)) return false;
  if (!expect(std::ranges::all_of(storage.writes(), [](auto& w) {
         return w.offset >= kFirmwareSlotOffset;
       }))) return false;
  if (!expect(lastWriteDone == image.size())) return false;
  if (!expect(!phases.empty() && phases.front() == FlashPhase::Write)) return false;
  if (!expect(phases.back() == FlashPhase::Complete)) return false;
  if (!expect(std::ranges::count(phases, FlashPhase::Verify) == 1)) return false;

  auto installed = session.installedFirmware();
  if (!expect(installed)) return false;
  if (!expect(installed->has_value())) return false;
  if (!expect((*installed)->info() == summary->firmware)) return false;
  if (!expect((*installed)->imageCrc() == summary->crc)) return false;
  return true;
}

static bool testFlashRejectsBeforeWriting() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  storage.resetCounters();

  const Bytes good = firmwareImage(kDeviceRevision, 5000);

  auto unconfirmed = session.flash(good, false);
  if (!expect(!unconfirmed)) return false;
  if (!expect(unconfirmed.error().phase == FlashPhase::Confirm)) return false;
  if (!expect(unconfirmed.error().error == FlashError::NotConfirmed)) return false;
  if (!expect(storage.readCount() == 0)) return false;

  Bytes damaged = good;
  damaged[kFirmwareHeaderSize + 10] ^= std::byte{0x01};
  auto invalid = session.flash(damaged, true);
  if (!expect(!invalid)) return false;
  if (!expect(invalid.error().phase == FlashPhase::Validate)) return false;
  if (!expect(invalid.error().error == FlashError::InvalidImage)) return false;
  if (!expect(invalid.error().format == FormatError::ChecksumMismatch)) return false;

  auto incompatible =
      session.flash(firmwareImage(kDeviceRevision + 1, 5000), true);
  if (!expect(!incompatible)) return false;
  if (!expect(incompatible.error().phase == FlashPhase::Compatibility)) return false;
  if (!expect(incompatible.error().error == FlashError::Incompatible)) return false;
  if (!expect(incompatible.error().incompatible ==
              IncompatibleError::HardwareRevisionMismatch)) return false;
  if (!expect(incompatible.error().imageRevision == uint16_t{kDeviceRevision + 1})) return false;
  if (!expect(incompatible.error().deviceRevision == kDeviceRevision)) return false;

  auto tooLarge = session.flash(
      firmwareImage(kDeviceRevision,
                    kFirmwareSlotSize - kFirmwareHeaderSize + 1),
      true);
  if (!expect(!tooLarge)) return false;
  if (!expect(tooLarge.error().phase == FlashPhase::Stage)) return false;
  if (!expect(tooLarge.error().error == FlashError::TooLarge)) return false;
  if (!expect(tooLarge.error().offset == uint64_t{kFirmwareSlotOffset})) return false;

  if (!expect(storage.writeCount() == 0)) return false;
  if (!expect(codec::allBytesEqual(
           storage.bytes(kFirmwareSlotOffset, kFirmwareSlotSize), kErasedByte))) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

static bool testFlashDetectsSilentCorruption() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  const Bytes image = firmwareImage(kDeviceRevision, 100000);
  storage.corruptWritesAt(kFirmwareSlotOffset + 5000);

  auto flashed = session.flash(image, true);
  if (!expect(!flashed)) return false;
  const FlashReport& report = flashed.error();
  if (!expect(report.phase == FlashPhase::Verify)) return false;
  if (!expect(report.error == FlashError::VerificationFailed)) return false;
  if (!expect(report.offset == uint64_t{kFirmwareSlotOffset + 5000})) return false;
  if (!expect(report.expectedByte == std::to_integer<uint8_t>(image[5000]))) return false;
  if (!expect(report.actualByte ==
              std::to_integer<uint8_t>(image[5000] ^ std::byte{0x01}))) return false;
  if (!expect(report.expectedCrc == codec::crc32(image))) return false;
  if (!expect(report.actualCrc && *report.actualCrc != codec::crc32(image))) return false;
  if (!expect(report.describe().find("offset: 0x00111388") != std::string::npos)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

static bool testFlashWriteFailure() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  storage.failWritesAt(kFirmwareSlotOffset + 70000);
  auto flashed = session.flash(firmwareImage(kDeviceRevision, 100000), true);
  if (!expect(!flashed)) return false;
  if (!expect(flashed.error().phase == FlashPhase::Write)) return false;
  if (!expect(flashed.error().error == FlashError::WriteFailed)) return false;
  if (!expect(flashed.error().io == IoError::WriteFailed)) return false;
  if (!expect(flashed.error().offset ==
              uint64_t{kFirmwareSlotOffset} + kTransferChunkSize)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

static bool testFlashInsideMbrPartition() {
  MemoryStorage storage(8 * 1024 * 1024);
  if (!expect(writePartitionEntry(storage.bytes(), 0, 0x0C, 2048, 8192))) return false;
  const uint64_t origin = 2048u * 512u;

  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  if (!expect(session.partition()->origin() == origin)) return false;
  if (!expect(hasMetadataMarker(storage.bytes(origin, kMetadataHeaderSize)))) return false;

  const Bytes image = firmwareImage(kDeviceRevision, 3000);
  auto flashed = session.flash(image, true);
  if (!expect(flashed)) return false;
  if (!expect(flashed->offset == kFirmwareSlotOffset)) return false;
  if (!expect(std::ranges::equal(
           storage.bytes(origin + kFirmwareSlotOffset, image.size()), image))) return false;

  // Reported offsets stay partition-relative.
  storage.corruptWritesAt(origin + kFirmwareSlotOffset + 10);
  auto corrupted = session.flash(image, true);
  if (!expect(!corrupted)) return false;
  if (!expect(corrupted.error().offset == uint64_t{kFirmwareSlotOffset + 10})) return false;
  return true;
}

static bool testInstalledFirmware() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  auto empty = session.installedFirmware();
  if (!expect(empty)) return false;
  if (!expect(!empty->has_value())) return false;

  const Bytes image = firmwareImage(kDeviceRevision, 4000);
  if (!expect(session.flash(image, true))) return false;

  storage.bytes()[kFirmwareSlotOffset + kFirmwareHeaderSize + 1] ^=
      std::byte{0x01};
  auto damaged = session.installedFirmware();
  if (!expect(!damaged)) return false;
  if (!expect(damaged.error().error == SessionError::CorruptFirmware)) return false;
  if (!expect(damaged.error().format == FormatError::ChecksumMismatch)) return false;

  auto header = std::span{storage.bytes()}.subspan(kFirmwareSlotOffset,
                                                    kFirmwareHeaderSize);
  if (!expect(codec::encodeField(header, kFirmwareHeaderFields.payloadLength,
                                 kFirmwareSlotSize, kFirmwareEndian))) return false;
  auto oversized = session.installedFirmware();
  if (!expect(!oversized)) return false;
  if (!expect(oversized.error().error == SessionError::CorruptFirmware)) return false;
  if (!expect(oversized.error().format == FormatError::LengthMismatch)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

static bool testClearFirmware() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;
  if (!expect(session.flash(firmwareImage(kDeviceRevision, 4000), true))) return false;
  storage.resetCounters();

  if (!expect(session.clearFirmware(false).error().error ==
              SessionError::NotConfirmed)) return false;
  if (!expect(storage.writeCount() == 0)) return false;

  if (!expect(session.clearFirmware(true))) return false;
  if (!expect(codec::allBytesEqual(
           storage.bytes(kFirmwareSlotOffset, kFirmwareSlotSize), kErasedByte))) return false;
  if (!expect(storage.syncCount() >= 1)) return false;
  if (!expect(!session.installedFirmware()->has_value())) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;

  storage.corruptWritesAt(kFirmwareSlotOffset + 1234);
  auto failed = session.clearFirmware(true);
  if (!expect(!failed)) return false;
  if (!expect(failed.error().error == SessionError::VerificationFailed)) return false;
  return true;
}

// -----------------------------------------------------------------------------
// Summary
// -----------------------------------------------------------------------------

static bool testSummary() {
  MemoryStorage storage(kDriveSize);
  DriveSession session;
  if (!expect(openInitialized(storage, session))) return false;

  const WorkoutLogEntry twoK = distanceWorkout(1);
  const WorkoutLogEntry pyramid = intervalWorkout(2);
  if (!expect(session.writeEntry(pyramid))) return false;
  if (!expect(session.writeEntry(twoK))) return false;
  placeEntry(storage, 2, Bytes(kSlotSize, std::byte{0}));

  auto summary = session.summary();
  if (!expect(summary)) return false;
  if (!expect(summary->user == (UserProfile{"ANNA", 7}))) return false;
  if (!expect(summary->hardwareRevision == kDeviceRevision)) return false;
  if (!expect(summary->entryCount == 2)) return false;
  if (!expect(summary->corruptCount == 1)) return false;
  if (!expect(summary->lifetimeMeters == 4400)) return false;
  if (!expect(summary->firstWorkout == twoK.startTime)) return false;
  if (!expect(summary->lastWorkout == pyramid.startTime)) return false;

  const double kwh = watts(twoK) * 480.0 / 3.6e6 + watts(pyramid) * 900.0 / 3.6e6;
  const double kcal = caloriesPerHour(watts(twoK)) * 480.0 / 3600.0 +
                      caloriesPerHour(watts(pyramid)) * 900.0 / 3600.0;
  if (!expect(std::abs(summary->lifetimeKwh - kwh) < 1e-9)) return false;
  if (!expect(std::abs(summary->lifetimeKcal - kcal) < 1e-6)) return false;
  if (!expect(summary->lifetimeKcal > 100.0 && summary->lifetimeKcal < 300.0)) return false;
  if (!expect(session.state() == SessionState::Opened)) return false;
  return true;
}

int main() {
  const TestCase tests[] = {
      {"open blank drive", &testOpenBlankDrive},
      {"closed session refuses", &testClosedSessionRefuses},
      {"init then reopen", &testInitThenReopen},
      {"forced init clears log", &testForcedInitClearsLog},
      {"too small drive", &testTooSmallDrive},
      {"damaged header", &testDamagedHeader},
      {"list mixed slots", &testListMixedSlots},
      {"read corrupt entry", &testReadCorruptEntry},
      {"read latest entry", &testReadLatestEntry},
      {"scanner rewinds", &testScannerRewinds},
      {"scanner bound to its open", &testScannerBoundToItsOpen},
      {"write entry round trip", &testWriteEntryRoundTrip},
      {"write entry rejections", &testWriteEntryRejections},
      {"write entry read-back mismatch", &testWriteEntryReadBackMismatch},
      {"flash happy path", &testFlashHappyPath},
      {"flash rejects before writing", &testFlashRejectsBeforeWriting},
      {"flash detects silent corruption", &testFlashDetectsSilentCorruption},
      {"flash write failure", &testFlashWriteFailure},
      {"flash inside MBR partition", &testFlashInsideMbrPartition},
      {"installed firmware", &testInstalledFirmware},
      {"clear firmware", &testClearFirmware},
      {"summary", &testSummary},
  };
  return runTests("session_tests", tests);
}
