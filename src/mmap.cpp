#include <format>
#include <system_error>
#include <utility>

#include <cohanon/mmap.hpp>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace cohanon {

namespace {

std::string lastSystemError() {
#ifdef _WIN32
  return std::system_category().message(static_cast<int>(GetLastError()));
#else
  return std::generic_category().message(errno);
#endif
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(std::exchange(other.fileHandle_, nullptr)),
      mappingHandle_(std::exchange(other.mappingHandle_, nullptr)),
#else
      fd_(std::exchange(other.fd_, -1)),
#endif
      data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)),
      writable_(std::exchange(other.writable_, false)) {
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    cleanup();
#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, std::string *outError) {
  close();

#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    if (outError) {
      *outError = std::format("Failed to open {} for reading: {}", path.string(), lastSystemError());
    }
    return false;
  }
  fileHandle_ = file;

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(file, &fileSize)) {
    if (outError) {
      *outError = std::format("Failed to get size of {}: {}", path.string(), lastSystemError());
    }
    close();
    return false;
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    if (outError) {
      *outError = std::format("Failed to open {} for reading: {}", path.string(), lastSystemError());
    }
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    if (outError) {
      *outError = std::format("Failed to get size of {}: {}", path.string(), lastSystemError());
    }
    close();
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    if (outError) {
      *outError = std::format("Not a regular file: {}", path.string());
    }
    close();
    return false;
  }
  size_ = static_cast<size_t>(st.st_size);
#endif

  if (size_ == 0) {
    if (outError) {
      *outError = std::format("File is empty: {}", path.string());
    }
    close();
    return false;
  }

  return map(path, false, outError);
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, std::string *outError) {
  close();

  if (size == 0) {
    if (outError) {
      *outError = "Cannot create file mapping with zero size";
    }
    return false;
  }

#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    if (outError) {
      *outError = std::format("Failed to create {}: {}", path.string(), lastSystemError());
    }
    return false;
  }
  fileHandle_ = file;

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(file, fileSize, nullptr, FILE_BEGIN) || !SetEndOfFile(file)) {
    if (outError) {
      *outError = std::format("Failed to resize {}: {}", path.string(), lastSystemError());
    }
    close();
    return false;
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    if (outError) {
      *outError = std::format("Failed to create {}: {}", path.string(), lastSystemError());
    }
    return false;
  }

  // Reserve the blocks up front: a shared mapping over a sparse file faults
  // with SIGBUS instead of reporting a full disk
#if defined(__APPLE__)
  fstore_t store{F_ALLOCATEALL, F_PEOFPOSMODE, 0, static_cast<off_t>(size), 0};
  if (fcntl(fd_, F_PREALLOCATE, &store) < 0 || ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    if (outError) {
      *outError = std::format("Failed to reserve {} bytes for {}: {}", size, path.string(),
                              lastSystemError());
    }
    close();
    return false;
  }
#else
  int rc = 0;
  while ((rc = posix_fallocate(fd_, 0, static_cast<off_t>(size))) == EINTR) {
  }
  if (rc != 0) {
    if (outError) {
      *outError = std::format("Failed to reserve {} bytes for {}: {}", size, path.string(),
                              std::generic_category().message(rc));
    }
    close();
    return false;
  }
#endif
#endif

  size_ = size;
  return map(path, true, outError);
}

bool MappedFile::map(const std::filesystem::path &path, bool writable, std::string *outError) {
#ifdef _WIN32
  mappingHandle_ = CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr,
                                      writable ? PAGE_READWRITE : PAGE_READONLY, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_),
                          writable ? FILE_MAP_WRITE : FILE_MAP_READ, 0, 0, 0);
  }
  if (!data_) {
    if (outError) {
      *outError = std::format("Failed to map {}: {}", path.string(), lastSystemError());
    }
    close();
    return false;
  }
#else
  void *mapped = mmap(nullptr, size_, writable ? (PROT_READ | PROT_WRITE) : PROT_READ,
                      writable ? MAP_SHARED : MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    if (outError) {
      *outError = std::format("Failed to map {}: {}", path.string(), lastSystemError());
    }
    close();
    return false;
  }
  data_ = mapped;
#endif

  writable_ = writable;
  return true;
}

bool MappedFile::flush(std::string *outError) {
  if (!data_ || !writable_) {
    if (outError) {
      *outError = "Cannot flush: file not open or not writable";
    }
    return false;
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    if (outError) {
      *outError = std::format("Failed to flush mapped file: {}", lastSystemError());
    }
    return false;
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    if (outError) {
      *outError = std::format("Failed to sync mapped file: {}", lastSystemError());
    }
    return false;
  }
#endif

  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
#ifdef _WIN32
  if (data_) {
    UnmapViewOfFile(data_);
  }
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (data_) {
    munmap(data_, size_);
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  data_ = nullptr;
  size_ = 0;
  writable_ = false;
}

} // namespace cohanon
