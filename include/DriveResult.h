#ifndef PM5_DRIVE_RESULT_H
#define PM5_DRIVE_RESULT_H

#include <cstdint>
#include <optional>
#include <string>

namespace pm5Drive {

/**
 * @brief Device access failures. Surfaced as-is, never retried.
 */
enum class IoError {
  OutOfBounds = 1,
  AccessDenied,
  DeviceBusy,
  InvalidDevice,
  ReadFailed,
  WriteFailed,
  SyncFailed
};

/**
 * @brief Malformed bytes found while decoding a record, header or image.
 */
enum class FormatError {
  Truncated = 1,
  LengthMismatch,
  ChecksumMismatch,
  BadMagic,
  UnsupportedVersion,
  TooManyIntervals,
  FieldOverflow,
  InvalidField
};

enum class InitError {
  AlreadyInitialized = 1,
  PartitionTooSmall,
  InvalidUserName,
  InvalidMetadata,
  IoFailure
};

enum class IncompatibleError {
  HardwareRevisionMismatch = 1
};

enum class FlashError {
  NotConfirmed = 1,
  NotInitialized,
  InvalidImage,
  Incompatible,
  TooLarge,
  WriteFailed,
  ReadBackFailed,
  VerificationFailed
};

enum class SessionError {
  NotOpen = 1,
  NotInitialized,
  NotConfirmed,
  SlotOutOfRange,
  LogFull,
  EntryNotFound,
  CorruptEntry,
  CorruptFirmware,
  EncodeFailed,
  IoFailure,
  VerificationFailed
};

const char* toString(IoError error);
const char* toString(FormatError error);
const char* toString(InitError error);
const char* toString(IncompatibleError error);
const char* toString(FlashError error);
const char* toString(SessionError error);

struct InitFailure {
  InitError error;
  std::optional<IoError> io;

  std::string describe() const;
};

struct SessionFailure {
  SessionError error;
  std::optional<IoError> io;
  std::optional<FormatError> format;
  std::optional<uint32_t> slot;

  std::string describe() const;
};

}  // namespace pm5Drive

#endif  // PM5_DRIVE_RESULT_H
