#pragma once
#ifndef APPENDFS_SEQUENTIAL_WRITE_STREAM_H
#define APPENDFS_SEQUENTIAL_WRITE_STREAM_H

#include "client/remote_file_client.h"
#include "lock/path_lock_manager.h"
#include "stream/file_stream.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace appendfs {

/// Settings a stream needs after open: how to re-create its file on
/// truncate(0) and how to pad it at close.
struct StreamSettings {
  WriteOptions writeOptions;
  size_t zeroFillChunkBytes{4 * 1024 * 1024};
};

/**
 * @brief Write-only stream adapting POSIX write/truncate onto a sequential,
 * write-once backend file.
 *
 * States:
 *  - Writable: an output handle is open. Writes must land exactly at the
 *    write frontier, except re-writes entirely inside the already written
 *    prefix, which are skipped.
 *  - DeferredOpen: opened on an existing complete file without O_TRUNC. No
 *    handle exists and writes fail with AlreadyExists until truncate(0).
 *  - Closed: terminal.
 *
 * A growing truncate only records the new logical length; close() writes
 * the missing zeroes. The path lock handed in at construction is held until
 * close(), which releases it on every path, including I/O failure.
 *
 * Every operation except read() is serialized by one mutex.
 */
class SequentialWriteStream : public FileStream {
public:
  SequentialWriteStream(RemoteFileClient &client, std::string uri,
                        CreateFileStatus status,
                        std::unique_ptr<LockHandle> lock,
                        std::unique_ptr<OutputHandle> output,
                        StreamSettings settings);
  /// Closes the stream if the owner did not; failures are logged.
  ~SequentialWriteStream() override;

  SequentialWriteStream(const SequentialWriteStream &) = delete;
  SequentialWriteStream &operator=(const SequentialWriteStream &) = delete;

  int64_t read(std::span<char> buf, int64_t size, int64_t offset) override;
  void write(std::span<const char> buf, int64_t size, int64_t offset) override;
  void truncate(int64_t size) override;
  void flush() override;
  CreateFileStatus getStatus() override;
  void close() override;
  bool isClosed() const override { return closed_.load(); }
  bool isReadOnly() const override { return false; }

  const std::string &uri() const { return uri_; }
  /// True while no output handle exists (opened without O_TRUNC).
  bool isDeferred();

private:
  CreateFileStatus refreshStatusLocked();
  void closeOutputLocked();
  void fillZerosLocked();
  std::unique_ptr<OutputHandle> createOutputLocked();

  RemoteFileClient &client_;
  const std::string uri_;
  CreateFileStatus status_;
  std::unique_ptr<LockHandle> lock_;
  std::unique_ptr<OutputHandle> output_;
  const StreamSettings settings_;

  std::mutex mutex_;
  std::atomic<bool> closed_{false};
};

} // namespace appendfs

#endif // APPENDFS_SEQUENTIAL_WRITE_STREAM_H
