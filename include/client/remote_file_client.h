#pragma once
#ifndef APPENDFS_REMOTE_FILE_CLIENT_H
#define APPENDFS_REMOTE_FILE_CLIENT_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace appendfs {

/// Value of WriteOptions::ttlMs meaning "keep forever".
constexpr int64_t NO_TTL = -1;

/**
 * @brief Placement hints forwarded unchanged to the backend when a new file
 * is created. The adapter never interprets them.
 */
struct WriteOptions {
  uint64_t blockSizeBytes{64ULL * 1024 * 1024};
  std::string storageTier{"MEM"};
  int64_t ttlMs{NO_TTL};
  std::string locationPolicy;
  std::map<std::string, std::string> locationPolicyOptions;
  std::string hostname;

  bool operator==(const WriteOptions &other) const = default;
};

/// Attributes handed to RemoteFileClient::createFile.
struct CreateOptions {
  uint32_t mode{0};
  uint32_t uid{0};
  uint32_t gid{0};
  WriteOptions writeOptions;
};

/// Backend view of one file.
struct FileInfo {
  std::string path;
  uint64_t length{0};
  uint32_t mode{0};
  uint32_t uid{0};
  uint32_t gid{0};
  /// True once the writer closed the file. Incomplete files belong to a
  /// writer that may live in another process.
  bool completed{false};
  /// Hex SHA-256 of the content, set on completion. Empty if unknown.
  std::string contentDigest;
};

/**
 * @brief Sequential, write-once output of a single backend file.
 *
 * Bytes are appended in order. There is no seek. All failures are reported
 * as StreamException with StreamErrorCode::RuntimeIO.
 */
class OutputHandle {
public:
  virtual ~OutputHandle() = default;

  virtual void write(const char *data, size_t size) = 0;
  virtual void flush() = 0;
  /// Bytes accepted by this handle so far.
  virtual uint64_t bytesWritten() const = 0;
  /// Flushes and marks the file completed. Closing twice is a no-op.
  virtual void close() = 0;
};

/**
 * @brief Client of the append-oriented remote store.
 *
 * Implementations must be safe to call from several threads at once.
 */
class RemoteFileClient {
public:
  virtual ~RemoteFileClient() = default;

  /// Status of @p path, or std::nullopt if it does not exist.
  virtual std::optional<FileInfo> getStatus(const std::string &path) = 0;

  /**
   * @brief Block until @p path is completed.
   * @param timeout Upper bound on the wait.
   * @param pollInterval How often the status (and @p cancel) is re-checked.
   * @param cancel Optional flag; the wait gives up once it reads true.
   * @return The completed status, or std::nullopt on timeout, cancellation,
   *         or if the file disappeared while waiting.
   */
  virtual std::optional<FileInfo>
  waitForCompletion(const std::string &path, std::chrono::milliseconds timeout,
                    std::chrono::milliseconds pollInterval,
                    const std::atomic<bool> *cancel) = 0;

  /// Create @p path (which must not exist) and open it for writing.
  virtual std::unique_ptr<OutputHandle>
  createFile(const std::string &path, const CreateOptions &options) = 0;

  /// Remove @p path. Throws StreamErrorCode::NotFound if it does not exist.
  virtual void deleteFile(const std::string &path) = 0;

  /// Read up to @p size bytes at @p offset of the persisted content.
  virtual std::vector<char> readFile(const std::string &path, uint64_t offset,
                                     size_t size) = 0;

  virtual std::vector<FileInfo> listFiles() = 0;
};

} // namespace appendfs

#endif // APPENDFS_REMOTE_FILE_CLIENT_H
