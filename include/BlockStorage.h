#ifndef PM5_DRIVE_BLOCK_STORAGE_H
#define PM5_DRIVE_BLOCK_STORAGE_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

#include "DriveResult.h"

namespace pm5Drive {

/**
 * @brief Positioned byte-level access to a drive or image file.
 *
 * Reads and writes are bounded by size(); requests past the end fail with
 * IoError::OutOfBounds. Implementations do not retry failed operations.
 */
class BlockStorage {
public:
  virtual ~BlockStorage() = default;

  virtual uint64_t size() const = 0;
  virtual std::expected<void, IoError> read(uint64_t offset,
                                            std::span<std::byte> out) = 0;
  virtual std::expected<void, IoError> write(
      uint64_t offset, std::span<const std::byte> data) = 0;
  virtual std::expected<void, IoError> sync() { return {}; }

protected:
  BlockStorage() = default;
  BlockStorage(const BlockStorage&) = default;
  BlockStorage& operator=(const BlockStorage&) = default;
};

/**
 * @brief BlockStorage over a file descriptor (block device or image file).
 *
 * Owns the descriptor and closes it on destruction, so every exit path of a
 * caller releases the device.
 */
class FileBlockStorage final : public BlockStorage {
public:
  static std::expected<FileBlockStorage, IoError> open(const std::string& path,
                                                       bool writable);
  // Creates or truncates a regular file of exactly `size` bytes, zero filled.
  static std::expected<FileBlockStorage, IoError> create(
      const std::string& path, uint64_t size);

  FileBlockStorage(FileBlockStorage&& other) noexcept;
  FileBlockStorage& operator=(FileBlockStorage&& other) noexcept;
  FileBlockStorage(const FileBlockStorage&) = delete;
  FileBlockStorage& operator=(const FileBlockStorage&) = delete;
  ~FileBlockStorage() override;

  uint64_t size() const override { return size_; }
  std::expected<void, IoError> read(uint64_t offset,
                                    std::span<std::byte> out) override;
  std::expected<void, IoError> write(uint64_t offset,
                                     std::span<const std::byte> data) override;
  std::expected<void, IoError> sync() override;

  bool writable() const { return writable_; }

private:
  FileBlockStorage(int fd, uint64_t size, bool writable);

  int fd_;
  uint64_t size_;
  bool writable_;
};

/**
 * @brief Partition-relative view of a BlockStorage.
 *
 * Every region of the drive format is addressed relative to origin(). The
 * view rejects requests that leave [0, size()).
 */
class Partition {
public:
  static constexpr uint32_t kSectorSize = 512;
  static constexpr uint8_t kSuperfloppyType = 0x00;

  Partition(BlockStorage& storage, uint64_t origin, uint64_t size,
            uint8_t typeTag);

  // Reads the MBR at sector 0 and picks the first non-empty entry. Without a
  // valid MBR the whole device is used (superfloppy layout).
  static std::expected<Partition, IoError> locate(BlockStorage& storage);

  uint64_t origin() const { return origin_; }
  uint64_t size() const { return size_; }
  uint8_t typeTag() const { return typeTag_; }

  std::expected<void, IoError> read(uint64_t offset, std::span<std::byte> out);
  std::expected<void, IoError> write(uint64_t offset,
                                     std::span<const std::byte> data);
  std::expected<void, IoError> fill(uint64_t offset, uint64_t length,
                                    std::byte value);
  std::expected<void, IoError> sync() { return storage_->sync(); }

private:
  bool contains(uint64_t offset, uint64_t length) const;

  BlockStorage* storage_;
  uint64_t origin_;
  uint64_t size_;
  uint8_t typeTag_;
};

}  // namespace pm5Drive

#endif  // PM5_DRIVE_BLOCK_STORAGE_H
