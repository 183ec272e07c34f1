#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace scb {

// RAII read-only memory mapping of a whole file
// Empty files open successfully and expose an empty view
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Open file for reading (memory-mapped)
  bool openRead(const std::filesystem::path &path, std::string *outError = nullptr);

  // Mapped bytes
  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  // Mapped bytes as text
  std::string_view view() const { return std::string_view(static_cast<const char *>(data_), size_); }

  // Close mapping and file handle
  void close();

  bool isOpen() const { return open_; }

  size_t size() const { return size_; }

private:
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE on Windows
  void *mappingHandle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool open_ = false;
};

} // namespace scb
