#pragma once
#ifndef APPENDFS_READ_STREAM_H
#define APPENDFS_READ_STREAM_H

#include "client/remote_file_client.h"
#include "lock/path_lock_manager.h"
#include "stream/file_stream.h"

#include <atomic>
#include <memory>
#include <string>

namespace appendfs {

/**
 * @brief Read-only stream over a completed backend file.
 *
 * Holds a READ lock on the path until close(), so the path cannot be opened
 * for write through this mount while it is being read.
 */
class ReadStream : public FileStream {
public:
  ReadStream(RemoteFileClient &client, std::string uri,
             std::unique_ptr<LockHandle> lock);
  ~ReadStream() override;

  ReadStream(const ReadStream &) = delete;
  ReadStream &operator=(const ReadStream &) = delete;

  /// @throws StreamException WriteConflict while the file is incomplete.
  int64_t read(std::span<char> buf, int64_t size, int64_t offset) override;
  void write(std::span<const char> buf, int64_t size, int64_t offset) override;
  void truncate(int64_t size) override;
  void flush() override {}
  CreateFileStatus getStatus() override;
  void close() override;
  bool isClosed() const override { return closed_.load(); }
  bool isReadOnly() const override { return true; }

  const std::string &uri() const { return uri_; }

private:
  FileInfo currentInfo();

  RemoteFileClient &client_;
  const std::string uri_;
  std::unique_ptr<LockHandle> lock_;
  std::atomic<bool> closed_{false};
};

} // namespace appendfs

#endif // APPENDFS_READ_STREAM_H
