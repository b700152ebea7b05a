#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace cohanon {

// RAII wrapper for a memory-mapped recording.
// Read-only mappings are private; write mappings are shared with the file.
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing non-empty file for reading
  bool openRead(const std::filesystem::path &path, std::string *outError = nullptr);

  // Create (or truncate) a file of exactly `size` bytes and map it for writing
  bool openWrite(const std::filesystem::path &path, size_t size, std::string *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  // Sync a write mapping to disk
  bool flush(std::string *outError = nullptr);

  void close();

  bool isOpen() const { return data_ != nullptr; }
  bool isWritable() const { return writable_; }
  size_t size() const { return size_; }

private:
  bool map(const std::filesystem::path &path, bool writable, std::string *outError);
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;
  void *mappingHandle_ = nullptr;
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

} // namespace cohanon
