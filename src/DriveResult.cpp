#include "DriveResult.h"

#include <format>

namespace pm5Drive {

const char* toString(IoError error) {
  switch (error) {
    case IoError::OutOfBounds: return "request outside storage bounds";
    case IoError::AccessDenied: return "access denied";
    case IoError::DeviceBusy: return "device busy";
    case IoError::InvalidDevice: return "invalid device";
    case IoError::ReadFailed: return "read failed";
    case IoError::WriteFailed: return "write failed";
    case IoError::SyncFailed: return "sync failed";
  }
  return "unknown I/O error";
}

const char* toString(FormatError error) {
  switch (error) {
    case FormatError::Truncated: return "truncated";
    case FormatError::LengthMismatch: return "length mismatch";
    case FormatError::ChecksumMismatch: return "checksum mismatch";
    case FormatError::BadMagic: return "bad magic";
    case FormatError::UnsupportedVersion: return "unsupported version";
    case FormatError::TooManyIntervals: return "too many intervals";
    case FormatError::FieldOverflow: return "field overflow";
    case FormatError::InvalidField: return "invalid field value";
  }
  return "unknown format error";
}

const char* toString(InitError error) {
  switch (error) {
    case InitError::AlreadyInitialized: return "drive already initialized";
    case InitError::PartitionTooSmall: return "partition too small";
    case InitError::InvalidUserName: return "user name must be 1 to 6 characters";
    case InitError::InvalidMetadata: return "metadata fields out of range";
    case InitError::IoFailure: return "I/O failure during initialization";
  }
  return "unknown init error";
}

const char* toString(IncompatibleError error) {
  switch (error) {
    case IncompatibleError::HardwareRevisionMismatch:
      return "hardware revision mismatch";
  }
  return "unknown compatibility error";
}

const char* toString(FlashError error) {
  switch (error) {
    case FlashError::NotConfirmed: return "firmware write not confirmed";
    case FlashError::NotInitialized: return "drive not initialized";
    case FlashError::InvalidImage: return "invalid firmware image";
    case FlashError::Incompatible: return "incompatible firmware image";
    case FlashError::TooLarge: return "image larger than firmware slot";
    case FlashError::WriteFailed: return "write to firmware slot failed";
    case FlashError::ReadBackFailed: return "read-back of firmware slot failed";
    case FlashError::VerificationFailed: return "read-back verification failed";
  }
  return "unknown flash error";
}

const char* toString(SessionError error) {
  switch (error) {
    case SessionError::NotOpen: return "session not open";
    case SessionError::NotInitialized: return "drive not initialized";
    case SessionError::NotConfirmed: return "operation not confirmed";
    case SessionError::SlotOutOfRange: return "slot out of range";
    case SessionError::LogFull: return "workout log full";
    case SessionError::EntryNotFound: return "entry not found";
    case SessionError::CorruptEntry: return "corrupt entry";
    case SessionError::CorruptFirmware: return "firmware slot holds no valid image";
    case SessionError::EncodeFailed: return "entry could not be encoded";
    case SessionError::IoFailure: return "I/O failure";
    case SessionError::VerificationFailed: return "read-back verification failed";
  }
  return "unknown session error";
}

std::string InitFailure::describe() const {
  if (io) {
    return std::format("{} ({})", toString(error), toString(*io));
  }
  return toString(error);
}

std::string SessionFailure::describe() const {
  std::string text = toString(error);
  if (slot) {
    text += std::format(" at slot {}", *slot);
  }
  if (format) {
    text += std::format(" ({})", toString(*format));
  }
  if (io) {
    text += std::format(" ({})", toString(*io));
  }
  return text;
}

}  // namespace pm5Drive
