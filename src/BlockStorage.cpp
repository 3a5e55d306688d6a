#include "BlockStorage.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <utility>

#include "BinaryCodec.h"

namespace pm5Drive {

// -----------------------------------------------------------------------------
// MBR Constants
// -----------------------------------------------------------------------------

static constexpr uint32_t kMbrPartitionTableOffset = 446;
static constexpr uint32_t kMbrPartitionEntrySize = 16;
static constexpr uint32_t kMbrPartitionCount = 4;
static constexpr uint32_t kMbrSignatureOffset = 510;
static constexpr uint16_t kMbrSignature = 0xAA55;

static constexpr Field kPartitionType{4, 1};
static constexpr Field kPartitionLbaStart{8, 4};
static constexpr Field kPartitionSectorCount{12, 4};

// Largest single transfer issued by fill().
static constexpr size_t kFillChunkSize = 64 * 1024;

static IoError ioErrorFromErrno(int error, IoError fallback) {
  switch (error) {
    case EACCES:
    case EPERM:
    case EROFS:
      return IoError::AccessDenied;
    case EBUSY:
      return IoError::DeviceBusy;
    case ENOENT:
    case ENXIO:
    case ENODEV:
    case EISDIR:
      return IoError::InvalidDevice;
    default:
      return fallback;
  }
}

// -----------------------------------------------------------------------------
// FileBlockStorage
// -----------------------------------------------------------------------------

FileBlockStorage::FileBlockStorage(int fd, uint64_t size, bool writable)
    : fd_(fd), size_(size), writable_(writable) {}

FileBlockStorage::FileBlockStorage(FileBlockStorage&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      size_(other.size_),
      writable_(other.writable_) {}

FileBlockStorage& FileBlockStorage::operator=(
    FileBlockStorage&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      close(fd_);
    }
    fd_ = std::exchange(other.fd_, -1);
    size_ = other.size_;
    writable_ = other.writable_;
  }
  return *this;
}

FileBlockStorage::~FileBlockStorage() {
  if (fd_ >= 0) {
    close(fd_);
  }
}

std::expected<FileBlockStorage, IoError> FileBlockStorage::open(
    const std::string& path, bool writable) {
  int fd = ::open(path.c_str(), writable ? O_RDWR : O_RDONLY);
  if (fd < 0) {
    return std::unexpected(ioErrorFromErrno(errno, IoError::InvalidDevice));
  }

  // Works for regular image files and for block devices on Linux.
  off_t end = lseek(fd, 0, SEEK_END);
  if (end < 0) {
    close(fd);
    return std::unexpected(IoError::InvalidDevice);
  }

  return FileBlockStorage(fd, static_cast<uint64_t>(end), writable);
}

std::expected<FileBlockStorage, IoError> FileBlockStorage::create(
    const std::string& path, uint64_t size) {
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return std::unexpected(ioErrorFromErrno(errno, IoError::InvalidDevice));
  }
  if (ftruncate(fd, static_cast<off_t>(size)) != 0) {
    close(fd);
    return std::unexpected(IoError::WriteFailed);
  }
  return FileBlockStorage(fd, size, true);
}

std::expected<void, IoError> FileBlockStorage::read(uint64_t offset,
                                                    std::span<std::byte> out) {
  if (fd_ < 0) {
    return std::unexpected(IoError::InvalidDevice);
  }
  if (offset > size_ || out.size() > size_ - offset) {
    return std::unexpected(IoError::OutOfBounds);
  }
  if (lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == -1) {
    return std::unexpected(IoError::ReadFailed);
  }

  std::byte* ptr = out.data();
  size_t remaining = out.size();
  while (remaining > 0) {
    ssize_t got = ::read(fd_, ptr, remaining);
    if (got == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(ioErrorFromErrno(errno, IoError::ReadFailed));
    }
    if (got == 0) {
      return std::unexpected(IoError::ReadFailed);
    }
    ptr += got;
    remaining -= static_cast<size_t>(got);
  }
  return {};
}

std::expected<void, IoError> FileBlockStorage::write(
    uint64_t offset, std::span<const std::byte> data) {
  if (fd_ < 0) {
    return std::unexpected(IoError::InvalidDevice);
  }
  if (!writable_) {
    return std::unexpected(IoError::AccessDenied);
  }
  if (offset > size_ || data.size() > size_ - offset) {
    return std::unexpected(IoError::OutOfBounds);
  }
  if (lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == -1) {
    return std::unexpected(IoError::WriteFailed);
  }

  const std::byte* ptr = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd_, ptr, remaining);
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(ioErrorFromErrno(errno, IoError::WriteFailed));
    }
    ptr += written;
    remaining -= static_cast<size_t>(written);
  }
  return {};
}

std::expected<void, IoError> FileBlockStorage::sync() {
  if (fd_ < 0) {
    return std::unexpected(IoError::InvalidDevice);
  }
  if (!writable_) {
    return {};
  }
  if (fsync(fd_) != 0) {
    return std::unexpected(IoError::SyncFailed);
  }
  return {};
}

// -----------------------------------------------------------------------------
// Partition
// -----------------------------------------------------------------------------

Partition::Partition(BlockStorage& storage, uint64_t origin, uint64_t size,
                     uint8_t typeTag)
    : storage_(&storage), origin_(origin), size_(size), typeTag_(typeTag) {}

std::expected<Partition, IoError> Partition::locate(BlockStorage& storage) {
  const uint64_t deviceSize = storage.size();
  if (deviceSize < kSectorSize) {
    return Partition(storage, 0, deviceSize, kSuperfloppyType);
  }

  std::array<std::byte, kSectorSize> mbr{};
  if (auto result = storage.read(0, mbr); !result) {
    return std::unexpected(result.error());
  }

  auto signature = codec::decodeU16(
      std::span{mbr}.subspan(kMbrSignatureOffset), Endian::Little);
  if (!signature || *signature != kMbrSignature) {
    return Partition(storage, 0, deviceSize, kSuperfloppyType);
  }

  for (uint32_t i = 0; i < kMbrPartitionCount; i++) {
    auto entry = std::span<const std::byte>{mbr}.subspan(
        kMbrPartitionTableOffset + i * kMbrPartitionEntrySize,
        kMbrPartitionEntrySize);
    auto type = codec::decodeField(entry, kPartitionType, Endian::Little);
    auto lbaStart = codec::decodeField(entry, kPartitionLbaStart, Endian::Little);
    auto sectors =
        codec::decodeField(entry, kPartitionSectorCount, Endian::Little);
    if (!type || !lbaStart || !sectors || *type == 0 || *sectors == 0) {
      continue;
    }

    // A boot sector that happens to end in 0x55AA is not a partition table
    // when its entries point outside the device.
    const uint64_t origin = uint64_t{*lbaStart} * kSectorSize;
    const uint64_t size = uint64_t{*sectors} * kSectorSize;
    if (origin == 0 || origin > deviceSize || size > deviceSize - origin) {
      continue;
    }
    return Partition(storage, origin, size, static_cast<uint8_t>(*type));
  }

  return Partition(storage, 0, deviceSize, kSuperfloppyType);
}

bool Partition::contains(uint64_t offset, uint64_t length) const {
  return offset <= size_ && length <= size_ - offset;
}

std::expected<void, IoError> Partition::read(uint64_t offset,
                                             std::span<std::byte> out) {
  if (!contains(offset, out.size())) {
    return std::unexpected(IoError::OutOfBounds);
  }
  return storage_->read(origin_ + offset, out);
}

std::expected<void, IoError> Partition::write(uint64_t offset,
                                              std::span<const std::byte> data) {
  if (!contains(offset, data.size())) {
    return std::unexpected(IoError::OutOfBounds);
  }
  return storage_->write(origin_ + offset, data);
}

std::expected<void, IoError> Partition::fill(uint64_t offset, uint64_t length,
                                             std::byte value) {
  if (!contains(offset, length)) {
    return std::unexpected(IoError::OutOfBounds);
  }

  Bytes buffer(static_cast<size_t>(std::min<uint64_t>(length, kFillChunkSize)),
               value);
  uint64_t remaining = length;
  uint64_t current = offset;
  while (remaining > 0) {
    const size_t toWrite =
        static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
    if (auto result = write(current, std::span{buffer.data(), toWrite});
        !result) {
      return result;
    }
    remaining -= toWrite;
    current += toWrite;
  }
  return {};
}

}  // namespace pm5Drive
