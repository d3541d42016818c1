#ifndef RANDSTREAM_BYTE_IO_HPP
#define RANDSTREAM_BYTE_IO_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace randstream {

/**
 * @brief Destination of a generated stream.
 *
 * The engine writes strictly sequentially and never seeks. Implementations
 * must either write all @p size bytes or throw IOError.
 */
class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual void write(const uint8_t *data, size_t size) = 0;

  /// Push written data down to the storage. Called once at the end of a run.
  virtual void flush() {}
};

/**
 * @brief Origin of a stream to validate.
 *
 * read() fills up to @p size bytes and only returns less at end of input.
 * Failures are reported by throwing IOError.
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual size_t read(uint8_t *data, size_t size) = 0;
};

/**
 * @brief Sink writing to a file, a block device or an inherited descriptor.
 */
class FileSink : public ByteSink {
public:
  /**
   * @brief Open @p path for writing, creating it if needed.
   * @param truncate Truncate regular files to zero length first. Block and
   *        character devices are never truncated.
   * @throw IOError If the path cannot be opened.
   */
  explicit FileSink(const std::string &path, bool truncate = true);

  /// Wrap an already open descriptor, closed on destruction if @p owns_fd.
  FileSink(int fd, bool owns_fd);

  ~FileSink() override;

  FileSink(const FileSink &) = delete;
  FileSink &operator=(const FileSink &) = delete;

  void write(const uint8_t *data, size_t size) override;

  /// fsync() regular files and block devices; no-op for pipes and ttys.
  void flush() override;

  const std::string &path() const { return path_; }

private:
  int fd_;
  bool owns_fd_;
  std::string path_;
};

/**
 * @brief Source reading from a file, a block device or an inherited
 * descriptor.
 */
class FileSource : public ByteSource {
public:
  /// @throw IOError If the path cannot be opened.
  explicit FileSource(const std::string &path);

  FileSource(int fd, bool owns_fd);

  ~FileSource() override;

  FileSource(const FileSource &) = delete;
  FileSource &operator=(const FileSource &) = delete;

  size_t read(uint8_t *data, size_t size) override;

private:
  int fd_;
  bool owns_fd_;
  std::string path_;
};

/// Sink that keeps everything in memory. Used by tests and benchmarks.
class MemorySink : public ByteSink {
public:
  void write(const uint8_t *data, size_t size) override {
    data_.insert(data_.end(), data, data + size);
  }

  const std::vector<uint8_t> &data() const { return data_; }
  std::vector<uint8_t> release() { return std::move(data_); }

private:
  std::vector<uint8_t> data_;
};

/// Source over an in-memory buffer.
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}

  size_t read(uint8_t *data, size_t size) override;

  /// Bytes consumed so far.
  size_t position() const { return position_; }

private:
  std::vector<uint8_t> data_;
  size_t position_{0};
};

/**
 * @brief Size in bytes of a regular file or block device.
 * @return std::nullopt if @p path does not exist or has no fixed size
 *         (pipes, character devices).
 * @throw IOError If the path cannot be inspected.
 */
std::optional<uint64_t> deviceCapacity(const std::string &path);

} // namespace randstream

#endif // RANDSTREAM_BYTE_IO_HPP
