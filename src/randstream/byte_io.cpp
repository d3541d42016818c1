#include "randstream/byte_io.hpp"
#include "randstream/errors.hpp"

#include <algorithm> // For std::min
#include <cerrno>
#include <cstring> // For std::memcpy
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <linux/fs.h> // For BLKGETSIZE64
#endif

namespace randstream {

namespace {

bool isRegularOrBlock(int fd) {
  struct stat st;
  if (::fstat(fd, &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode) || S_ISBLK(st.st_mode);
}

} // namespace

FileSink::FileSink(const std::string &path, bool truncate)
    : fd_(-1), owns_fd_(true), path_(path) {
  int flags = O_WRONLY | O_CREAT;
  struct stat st;
  bool is_regular = ::stat(path.c_str(), &st) != 0 || S_ISREG(st.st_mode);
  if (truncate && is_regular) {
    flags |= O_TRUNC;
  }
  do {
    fd_ = ::open(path.c_str(), flags, 0644);
  } while (fd_ < 0 && errno == EINTR);
  if (fd_ < 0) {
    throw IOError("cannot open " + path + " for writing", errno);
  }
}

FileSink::FileSink(int fd, bool owns_fd)
    : fd_(fd), owns_fd_(owns_fd), path_("<fd " + std::to_string(fd) + ">") {}

FileSink::~FileSink() {
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
}

void FileSink::write(const uint8_t *data, size_t size) {
  size_t done = 0;
  while (done < size) {
    ssize_t n = ::write(fd_, data + done, size - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw IOError("write to " + path_ + " failed", errno);
    }
    if (n == 0) {
      throw IOError("write to " + path_ + " made no progress (device full?)",
                    ENOSPC);
    }
    done += static_cast<size_t>(n);
  }
}

void FileSink::flush() {
  if (!isRegularOrBlock(fd_)) {
    return;
  }
  if (::fsync(fd_) != 0) {
    throw IOError("fsync of " + path_ + " failed", errno);
  }
}

FileSource::FileSource(const std::string &path)
    : fd_(-1), owns_fd_(true), path_(path) {
  do {
    fd_ = ::open(path.c_str(), O_RDONLY);
  } while (fd_ < 0 && errno == EINTR);
  if (fd_ < 0) {
    throw IOError("cannot open " + path + " for reading", errno);
  }
}

FileSource::FileSource(int fd, bool owns_fd)
    : fd_(fd), owns_fd_(owns_fd), path_("<fd " + std::to_string(fd) + ">") {}

FileSource::~FileSource() {
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
}

size_t FileSource::read(uint8_t *data, size_t size) {
  size_t done = 0;
  while (done < size) {
    ssize_t n = ::read(fd_, data + done, size - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw IOError("read from " + path_ + " failed", errno);
    }
    if (n == 0) {
      break; // end of input
    }
    done += static_cast<size_t>(n);
  }
  return done;
}

size_t MemorySource::read(uint8_t *data, size_t size) {
  size_t n = std::min(size, data_.size() - position_);
  if (n > 0) {
    std::memcpy(data, data_.data() + position_, n);
    position_ += n;
  }
  return n;
}

std::optional<uint64_t> deviceCapacity(const std::string &path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) {
      return std::nullopt;
    }
    throw IOError("cannot stat " + path, errno);
  }
  if (S_ISREG(st.st_mode)) {
    return static_cast<uint64_t>(st.st_size);
  }
#ifdef BLKGETSIZE64
  if (S_ISBLK(st.st_mode)) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
      throw IOError("cannot open " + path, errno);
    }
    uint64_t size = 0;
    int rc = ::ioctl(fd, BLKGETSIZE64, &size);
    int saved_errno = errno;
    ::close(fd);
    if (rc != 0) {
      throw IOError("cannot query the size of block device " + path,
                    saved_errno);
    }
    return size;
  }
#endif
  return std::nullopt;
}

} // namespace randstream
