#include "WorkoutRecord.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <utility>

namespace pm5Drive {

// -----------------------------------------------------------------------------
// Slot Helpers
// -----------------------------------------------------------------------------

// The checksum covers every byte of the slot except the checksum itself, so
// a change anywhere, padding included, is caught before any field is read.
static uint16_t slotChecksum(std::span<const std::byte> slot) {
  const uint16_t head = codec::crc16(slot.first(kEntryChecksumField.offset));
  return codec::crc16(slot.subspan(kEntryChecksumField.end()), head);
}

static uint32_t readField(std::span<const std::byte> buffer, Field field) {
  return codec::decodeField(buffer, field, kEntryEndian).value_or(0);
}

static std::optional<uint16_t> peekEntryId(std::span<const std::byte> slot) {
  auto version = codec::decodeField(slot, kEntryVersionField, kEntryEndian);
  const EntryFormat* format =
      version ? findEntryFormat(static_cast<uint8_t>(*version)) : nullptr;
  if (format == nullptr) {
    format = findEntryFormat(kCurrentEntryVersion);
  }
  auto id = codec::decodeField(slot, format->header.entryId, kEntryEndian);
  if (!id) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*id);
}

bool isErasedSlot(std::span<const std::byte> slot) {
  return !slot.empty() && codec::allBytesEqual(slot, kErasedByte);
}

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------

static IntervalRecord decodeInterval(std::span<const std::byte> block,
                                     const IntervalFields& f) {
  const uint8_t tag = static_cast<uint8_t>(readField(block, f.kind));

  IntervalResult result{
      .durationTenths = readField(block, f.duration),
      .distanceMeters = readField(block, f.distance),
      .strokeRate = static_cast<uint8_t>(readField(block, f.strokeRate)),
      .heartRate = static_cast<uint8_t>(readField(block, f.heartRate)),
      .paceTenths = static_cast<uint16_t>(readField(block, f.pace)),
      .calories = static_cast<uint16_t>(readField(block, f.calories)),
      .watts = static_cast<uint16_t>(readField(block, f.watts)),
  };

  switch (tag) {
    case static_cast<uint8_t>(IntervalKind::Time):
      return TimeInterval{readField(block, f.target), result};
    case static_cast<uint8_t>(IntervalKind::Distance):
      return DistanceInterval{readField(block, f.target), result};
    case static_cast<uint8_t>(IntervalKind::Calorie):
      return CalorieInterval{readField(block, f.target), result};
    case static_cast<uint8_t>(IntervalKind::Rest):
      return RestInterval{result.durationTenths, result.heartRate};
    default:
      return RawInterval{tag, Bytes(block.begin(), block.end())};
  }
}

std::expected<WorkoutLogEntry, CorruptEntry> decodeEntry(
    std::span<const std::byte> slot) {
  auto corrupt = [&slot](FormatError reason) {
    return std::unexpected(CorruptEntry{
        .reason = reason,
        .raw = Bytes(slot.begin(), slot.end()),
        .entryId = peekEntryId(slot),
    });
  };

  if (slot.size() < kSlotSize) {
    return corrupt(FormatError::Truncated);
  }
  slot = slot.first(kSlotSize);

  if (readField(slot, kEntryChecksumField) != slotChecksum(slot)) {
    return corrupt(FormatError::ChecksumMismatch);
  }
  if (readField(slot, kEntryMagicField) != kEntryMagic) {
    return corrupt(FormatError::BadMagic);
  }

  const EntryFormat* format =
      findEntryFormat(static_cast<uint8_t>(readField(slot, kEntryVersionField)));
  if (format == nullptr) {
    return corrupt(FormatError::UnsupportedVersion);
  }

  const auto& h = format->header;
  const uint32_t intervalCount = readField(slot, h.intervalCount);
  if (intervalCount > kMaxIntervals) {
    return corrupt(FormatError::TooManyIntervals);
  }
  if (readField(slot, kEntryLengthField) != format->lengthFor(intervalCount)) {
    return corrupt(FormatError::LengthMismatch);
  }

  WorkoutLogEntry entry;
  entry.formatVersion = format->version;
  entry.entryId = static_cast<uint16_t>(readField(slot, h.entryId));
  entry.type = static_cast<WorkoutType>(readField(slot, h.workoutType));
  entry.startTime = codec::decodeTimestamp(readField(slot, h.startTime));
  entry.serialNumber = readField(slot, h.serialNumber);
  entry.userId = static_cast<uint16_t>(readField(slot, h.userId));
  entry.totalDurationTenths = readField(slot, h.totalDuration);
  entry.totalDistanceMeters = readField(slot, h.totalDistance);
  entry.restDurationTenths = readField(slot, h.restDuration);
  entry.summary = WorkoutSummary{
      .calories = static_cast<uint16_t>(readField(slot, h.calories)),
      .strokeRate = static_cast<uint8_t>(readField(slot, h.strokeRate)),
      .heartRate = static_cast<uint8_t>(readField(slot, h.heartRate)),
      .dragFactor = static_cast<uint8_t>(readField(slot, h.dragFactor)),
  };
  entry.name = codec::decodeText(slot, h.name).value_or("");

  entry.intervals.reserve(intervalCount);
  for (uint32_t i = 0; i < intervalCount; i++) {
    entry.intervals.push_back(decodeInterval(
        slot.subspan(format->headerSize + i * format->intervalSize,
                     format->intervalSize),
        format->interval));
  }

  return entry;
}

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------

namespace {

// Writes one numeric field. A non-zero value for a field the version does not
// have would be lost on the way back, so it is refused.
std::expected<void, FormatError> put(std::span<std::byte> buffer, Field field,
                                     uint32_t value) {
  if (!field.present()) {
    if (value != 0) {
      return std::unexpected(FormatError::FieldOverflow);
    }
    return {};
  }
  return codec::encodeField(buffer, field, value, kEntryEndian);
}

std::expected<void, FormatError> putResult(std::span<std::byte> block,
                                           const IntervalFields& f,
                                           IntervalKind kind, uint32_t target,
                                           const IntervalResult& result) {
  const std::pair<Field, uint32_t> values[] = {
      {f.kind, static_cast<uint8_t>(kind)},
      {f.target, target},
      {f.duration, result.durationTenths},
      {f.distance, result.distanceMeters},
      {f.strokeRate, result.strokeRate},
      {f.heartRate, result.heartRate},
      {f.pace, result.paceTenths},
      {f.calories, result.calories},
      {f.watts, result.watts},
  };
  for (const auto& [field, value] : values) {
    if (auto r = put(block, field, value); !r) {
      return r;
    }
  }
  return {};
}

struct IntervalEncoder {
  std::span<std::byte> block;
  const IntervalFields& f;

  std::expected<void, FormatError> operator()(const TimeInterval& i) const {
    return putResult(block, f, IntervalKind::Time, i.targetTenths, i.result);
  }
  std::expected<void, FormatError> operator()(const DistanceInterval& i) const {
    return putResult(block, f, IntervalKind::Distance, i.targetMeters,
                     i.result);
  }
  std::expected<void, FormatError> operator()(const CalorieInterval& i) const {
    return putResult(block, f, IntervalKind::Calorie, i.targetCalories,
                     i.result);
  }
  std::expected<void, FormatError> operator()(const RestInterval& i) const {
    IntervalResult rest{.durationTenths = i.durationTenths,
                        .heartRate = i.heartRate};
    return putResult(block, f, IntervalKind::Rest, i.durationTenths, rest);
  }
  std::expected<void, FormatError> operator()(const RawInterval& i) const {
    if (i.bytes.size() != block.size()) {
      return std::unexpected(FormatError::LengthMismatch);
    }
    // A known tag would decode as that kind instead of coming back raw.
    switch (i.kindTag) {
      case static_cast<uint8_t>(IntervalKind::Time):
      case static_cast<uint8_t>(IntervalKind::Distance):
      case static_cast<uint8_t>(IntervalKind::Rest):
      case static_cast<uint8_t>(IntervalKind::Calorie):
        return std::unexpected(FormatError::InvalidField);
      default:
        break;
    }
    // The kind byte inside the block is the tag itself.
    auto tag = codec::decodeField(i.bytes, f.kind, kEntryEndian);
    if (!tag) {
      return std::unexpected(tag.error());
    }
    if (*tag != i.kindTag) {
      return std::unexpected(FormatError::InvalidField);
    }
    std::copy(i.bytes.begin(), i.bytes.end(), block.begin());
    return {};
  }
};

}  // namespace

std::expected<Bytes, FormatError> encodeEntry(const WorkoutLogEntry& entry) {
  const EntryFormat* format = findEntryFormat(entry.formatVersion);
  if (format == nullptr) {
    return std::unexpected(FormatError::UnsupportedVersion);
  }
  if (entry.intervals.size() > kMaxIntervals) {
    return std::unexpected(FormatError::TooManyIntervals);
  }

  auto startTime = codec::encodeTimestamp(entry.startTime);
  if (!startTime) {
    return std::unexpected(startTime.error());
  }

  Bytes slot(kSlotSize, std::byte{0});
  const auto& h = format->header;
  const uint32_t count = static_cast<uint32_t>(entry.intervals.size());

  const std::pair<Field, uint32_t> values[] = {
      {kEntryMagicField, kEntryMagic},
      {kEntryVersionField, format->version},
      {kEntryLengthField, format->lengthFor(count)},
      {h.workoutType, static_cast<uint8_t>(entry.type)},
      {h.intervalCount, count},
      {h.entryId, entry.entryId},
      {h.userId, entry.userId},
      {h.serialNumber, entry.serialNumber},
      {h.startTime, *startTime},
      {h.totalDuration, entry.totalDurationTenths},
      {h.totalDistance, entry.totalDistanceMeters},
      {h.restDuration, entry.restDurationTenths},
      {h.calories, entry.summary.calories},
      {h.strokeRate, entry.summary.strokeRate},
      {h.heartRate, entry.summary.heartRate},
      {h.dragFactor, entry.summary.dragFactor},
  };
  for (const auto& [field, value] : values) {
    if (auto r = put(slot, field, value); !r) {
      return std::unexpected(r.error());
    }
  }
  if (auto r = codec::encodeText(slot, h.name, entry.name); !r) {
    return std::unexpected(r.error());
  }

  for (uint32_t i = 0; i < count; i++) {
    auto block = std::span{slot}.subspan(
        format->headerSize + i * format->intervalSize, format->intervalSize);
    if (auto r = std::visit(IntervalEncoder{block, format->interval},
                            entry.intervals[i]);
        !r) {
      return std::unexpected(r.error());
    }
  }

  if (auto r = put(slot, kEntryChecksumField, slotChecksum(slot)); !r) {
    return std::unexpected(r.error());
  }
  return slot;
}

// -----------------------------------------------------------------------------
// Names & Metrics
// -----------------------------------------------------------------------------

const char* toString(WorkoutType type) {
  switch (type) {
    case WorkoutType::FreeRow: return "Free Row";
    case WorkoutType::SingleDistance: return "Distance";
    case WorkoutType::SingleTime: return "Time";
    case WorkoutType::TimeInterval: return "Time Interval";
    case WorkoutType::DistanceInterval: return "Distance Interval";
    case WorkoutType::VariableInterval: return "Variable Interval";
    case WorkoutType::SingleCalorie: return "Calories";
  }
  return "Unknown";
}

const char* toString(IntervalKind kind) {
  switch (kind) {
    case IntervalKind::Time: return "Time";
    case IntervalKind::Distance: return "Distance";
    case IntervalKind::Rest: return "Rest";
    case IntervalKind::Calorie: return "Calorie";
  }
  return "Unknown";
}

namespace {

struct KindOf {
  std::optional<IntervalKind> operator()(const TimeInterval&) const {
    return IntervalKind::Time;
  }
  std::optional<IntervalKind> operator()(const DistanceInterval&) const {
    return IntervalKind::Distance;
  }
  std::optional<IntervalKind> operator()(const CalorieInterval&) const {
    return IntervalKind::Calorie;
  }
  std::optional<IntervalKind> operator()(const RestInterval&) const {
    return IntervalKind::Rest;
  }
  std::optional<IntervalKind> operator()(const RawInterval&) const {
    return std::nullopt;
  }
};

}  // namespace

std::optional<IntervalKind> intervalKind(const IntervalRecord& interval) {
  return std::visit(KindOf{}, interval);
}

uint8_t kindTag(const IntervalRecord& interval) {
  if (const auto* raw = std::get_if<RawInterval>(&interval)) {
    return raw->kindTag;
  }
  return static_cast<uint8_t>(*intervalKind(interval));
}

uint32_t paceTenths(uint32_t durationTenths, uint32_t distanceMeters) {
  if (distanceMeters == 0) {
    return 0;
  }
  return static_cast<uint32_t>(
      (uint64_t{durationTenths} * 500 + distanceMeters / 2) / distanceMeters);
}

double watts(uint32_t durationTenths, uint32_t distanceMeters) {
  if (durationTenths == 0 || distanceMeters == 0) {
    return 0.0;
  }
  // Concept2 power formula with pace in seconds per metre.
  const double pace = (durationTenths / 10.0) / distanceMeters;
  return 2.8 / std::pow(pace, 3);
}

double caloriesPerHour(double watts) { return watts * 3.44 + 300.0; }

double caloriesPerHour(double watts, double bodyWeightKg) {
  return watts * 3.44 + 1.714 * 2.2046 * bodyWeightKg;
}

double watts(const WorkoutLogEntry& entry) {
  return watts(entry.totalDurationTenths, entry.totalDistanceMeters);
}

uint32_t paceTenths(const WorkoutLogEntry& entry) {
  return paceTenths(entry.totalDurationTenths, entry.totalDistanceMeters);
}

std::optional<uint32_t> averageHeartRate(const WorkoutLogEntry& entry) {
  uint32_t sum = 0;
  uint32_t count = 0;
  for (const IntervalRecord& interval : entry.intervals) {
    const IntervalResult* result = nullptr;
    if (const auto* t = std::get_if<TimeInterval>(&interval)) {
      result = &t->result;
    } else if (const auto* d = std::get_if<DistanceInterval>(&interval)) {
      result = &d->result;
    } else if (const auto* c = std::get_if<CalorieInterval>(&interval)) {
      result = &c->result;
    }
    if (result == nullptr) {
      continue;
    }
    if (result->heartRate == 0) {
      return std::nullopt;
    }
    sum += result->heartRate;
    count++;
  }
  if (count == 0) {
    return std::nullopt;
  }
  return sum / count;
}

std::string formatTenths(uint32_t tenths) {
  const uint32_t seconds = tenths / 10;
  if (seconds > 3600) {
    return std::format("{}:{:02}:{:02}.{}", seconds / 3600, (seconds / 60) % 60,
                       seconds % 60, tenths % 10);
  }
  return std::format("{}:{:02}.{}", seconds / 60, seconds % 60, tenths % 10);
}

}  // namespace pm5Drive
