#ifndef PM5_DRIVE_WORKOUT_RECORD_H
#define PM5_DRIVE_WORKOUT_RECORD_H

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "BinaryCodec.h"
#include "DriveLayout.h"
#include "DriveResult.h"

namespace pm5Drive {

// Values are the workout type tags stored by the monitor. Tags outside this
// list survive decoding unchanged.
enum class WorkoutType : uint8_t {
  FreeRow = 0x01,
  SingleDistance = 0x03,
  SingleTime = 0x05,
  TimeInterval = 0x06,
  DistanceInterval = 0x07,
  VariableInterval = 0x08,
  SingleCalorie = 0x0A
};

enum class IntervalKind : uint8_t {
  Time = 0x01,
  Distance = 0x02,
  Rest = 0x03,
  Calorie = 0x04
};

// What the rower actually did during a work interval.
struct IntervalResult {
  uint32_t durationTenths = 0;
  uint32_t distanceMeters = 0;
  uint8_t strokeRate = 0;
  uint8_t heartRate = 0;
  uint16_t paceTenths = 0;  // per 500 m
  uint16_t calories = 0;
  uint16_t watts = 0;       // version 2 and later

  bool operator==(const IntervalResult&) const = default;
};

struct TimeInterval {
  uint32_t targetTenths = 0;
  IntervalResult result;

  bool operator==(const TimeInterval&) const = default;
};

struct DistanceInterval {
  uint32_t targetMeters = 0;
  IntervalResult result;

  bool operator==(const DistanceInterval&) const = default;
};

struct CalorieInterval {
  uint32_t targetCalories = 0;
  IntervalResult result;

  bool operator==(const CalorieInterval&) const = default;
};

// Rest uses the duration field; its distance is zero on disk.
struct RestInterval {
  uint32_t durationTenths = 0;
  uint8_t heartRate = 0;

  bool operator==(const RestInterval&) const = default;
};

// An interval whose kind tag is not known. The whole interval block is kept
// so the entry can be written back unchanged.
struct RawInterval {
  uint8_t kindTag = 0;
  Bytes bytes;

  bool operator==(const RawInterval&) const = default;
};

using IntervalRecord = std::variant<TimeInterval, DistanceInterval,
                                    CalorieInterval, RestInterval, RawInterval>;

struct WorkoutSummary {
  uint16_t calories = 0;
  uint8_t strokeRate = 0;
  uint8_t heartRate = 0;
  uint8_t dragFactor = 0;  // version 2 and later

  bool operator==(const WorkoutSummary&) const = default;
};

struct WorkoutLogEntry {
  uint8_t formatVersion = kCurrentEntryVersion;
  uint16_t entryId = 0;
  WorkoutType type = WorkoutType::FreeRow;
  std::chrono::sys_seconds startTime{
      std::chrono::seconds{codec::kDeviceEpochUnixSeconds}};
  uint32_t serialNumber = 0;
  uint16_t userId = 0;
  uint32_t totalDurationTenths = 0;
  uint32_t totalDistanceMeters = 0;
  uint32_t restDurationTenths = 0;
  WorkoutSummary summary;
  std::string name;
  std::vector<IntervalRecord> intervals;

  bool operator==(const WorkoutLogEntry&) const = default;
};

// A slot that could not be trusted. entryId is read from the raw bytes when
// they are long enough and is not validated.
struct CorruptEntry {
  FormatError reason;
  Bytes raw;
  std::optional<uint16_t> entryId;
};

// -----------------------------------------------------------------------------
// Serializer
// -----------------------------------------------------------------------------

// Expects a full slot (kSlotSize bytes). Checks run in this order: size,
// checksum over the slot, magic, version, interval count, declared length.
std::expected<WorkoutLogEntry, CorruptEntry> decodeEntry(
    std::span<const std::byte> slot);

// Produces a full slot image. The declared length and checksum are always
// computed here.
std::expected<Bytes, FormatError> encodeEntry(const WorkoutLogEntry& entry);

bool isErasedSlot(std::span<const std::byte> slot);

// -----------------------------------------------------------------------------
// Metrics
// -----------------------------------------------------------------------------

const char* toString(WorkoutType type);
const char* toString(IntervalKind kind);

// Kind of a record; RawInterval reports its stored tag through kindTag().
std::optional<IntervalKind> intervalKind(const IntervalRecord& interval);
uint8_t kindTag(const IntervalRecord& interval);

// Time per 500 m in tenths of a second.
uint32_t paceTenths(uint32_t durationTenths, uint32_t distanceMeters);
double watts(uint32_t durationTenths, uint32_t distanceMeters);
double caloriesPerHour(double watts);
double caloriesPerHour(double watts, double bodyWeightKg);

double watts(const WorkoutLogEntry& entry);
uint32_t paceTenths(const WorkoutLogEntry& entry);

// Mean heart rate over work intervals, empty when any of them lacks one.
std::optional<uint32_t> averageHeartRate(const WorkoutLogEntry& entry);

// "m:ss.t", or "h:mm:ss.t" past one hour.
std::string formatTenths(uint32_t tenths);

}  // namespace pm5Drive

#endif  // PM5_DRIVE_WORKOUT_RECORD_H
