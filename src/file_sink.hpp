#pragma once

#include <cstddef>
#include <filesystem>

// Write-only file opened with create-if-absent semantics. A sink that is
// destroyed without commit() removes whatever it wrote.
class FileSink {
public:
  // Throws FtrError(NameCollision) when the path already exists and
  // FtrError(IOError) for any other open failure.
  static FileSink create_exclusive(const std::filesystem::path& path, unsigned mode = 0644);

  FileSink(FileSink&& other) noexcept;
  FileSink& operator=(FileSink&& other) noexcept;
  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;
  ~FileSink();

  void write(const char* data, std::size_t size);
  void commit();
  // Closes and unlinks an open sink; no-op once committed.
  void discard();

  const std::filesystem::path& path() const { return path_; }
  std::size_t bytes_written() const { return written_; }
  bool is_open() const { return fd_ >= 0; }

private:
  FileSink(int fd, std::filesystem::path path);
  void close_fd();

  int fd_ = -1;
  std::filesystem::path path_;
  std::size_t written_ = 0;
};
