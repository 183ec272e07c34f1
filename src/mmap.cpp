#include <utility>

#include <fmt/format.h>

#include <scb/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace scb {

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
      open_(std::exchange(other.open_, false)) {
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    open_ = std::exchange(other.open_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, std::string *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    if (outError) {
      *outError = fmt::format("Cannot open file: {} (error: {})", path.string(), GetLastError());
    }
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    if (outError) {
      *outError = fmt::format("Cannot stat file: {} (error: {})", path.string(), GetLastError());
    }
    close();
    return false;
  }

  size_ = static_cast<size_t>(fileSize.QuadPart);
  open_ = true;
  if (size_ == 0) {
    // Nothing to map
    return true;
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  }
  if (!data_) {
    if (outError) {
      *outError = fmt::format("Cannot map file: {} (error: {})", path.string(), GetLastError());
    }
    close();
    return false;
  }
  return true;

#else
  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0) {
    if (outError) {
      *outError = fmt::format("Cannot open file: {} ({})", path.string(), std::strerror(errno));
    }
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    if (outError) {
      *outError = fmt::format("Cannot stat file: {} ({})", path.string(), std::strerror(errno));
    }
    close();
    return false;
  }

  if (!S_ISREG(st.st_mode)) {
    if (outError) {
      *outError = fmt::format("Not a regular file: {}", path.string());
    }
    close();
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);
  open_ = true;
  if (size_ == 0) {
    // mmap rejects zero-length mappings
    return true;
  }

  void *mapped = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (mapped == MAP_FAILED) {
    if (outError) {
      *outError = fmt::format("Cannot map file: {} ({})", path.string(), std::strerror(errno));
    }
    close();
    return false;
  }
  data_ = mapped;
  return true;
#endif
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  open_ = false;
}

} // namespace scb
