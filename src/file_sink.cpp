#include "file_sink.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <utility>

namespace {

std::string errno_message(const std::string& what, const std::filesystem::path& path, int err) {
  return what + " " + path.string() + ": " + std::strerror(err);
}

} // namespace

FileSink FileSink::create_exclusive(const std::filesystem::path& path, unsigned mode) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, static_cast<mode_t>(mode));
  if(fd < 0) {
    int err = errno;
    if(err == EEXIST) {
      throw FtrError(ErrorKind::NameCollision, "file already exists: " + path.string());
    }
    throw FtrError(ErrorKind::IOError, errno_message("failed to create", path, err));
  }
  return FileSink(fd, path);
}

FileSink::FileSink(int fd, std::filesystem::path path)
  : fd_(fd), path_(std::move(path)) {}

FileSink::FileSink(FileSink&& other) noexcept
  : fd_(std::exchange(other.fd_, -1)),
    path_(std::move(other.path_)),
    written_(other.written_) {}

FileSink& FileSink::operator=(FileSink&& other) noexcept {
  if(this != &other) {
    if(fd_ >= 0) discard();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
    written_ = other.written_;
  }
  return *this;
}

FileSink::~FileSink() {
  if(fd_ >= 0) discard();
}

void FileSink::write(const char* data, std::size_t size) {
  if(fd_ < 0) {
    throw FtrError(ErrorKind::IOError, "write to closed file " + path_.string());
  }
  while(size > 0) {
    ssize_t n = ::write(fd_, data, size);
    if(n < 0) {
      if(errno == EINTR) continue;
      throw FtrError(ErrorKind::IOError, errno_message("failed to write", path_, errno));
    }
    data += n;
    size -= static_cast<std::size_t>(n);
    written_ += static_cast<std::size_t>(n);
  }
}

void FileSink::commit() {
  if(fd_ < 0) return;
  int rc = ::close(fd_);
  fd_ = -1;
  if(rc != 0) {
    int err = errno;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    throw FtrError(ErrorKind::IOError, errno_message("failed to close", path_, err));
  }
}

void FileSink::discard() {
  if(fd_ < 0) return;
  close_fd();
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

void FileSink::close_fd() {
  if(fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}
