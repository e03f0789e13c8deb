#pragma once
#ifndef APPENDFS_STREAM_FACTORY_H
#define APPENDFS_STREAM_FACTORY_H

#include "client/remote_file_client.h"
#include "lock/path_lock_manager.h"
#include "stream/auth_policy.h"
#include "stream/read_stream.h"
#include "stream/sequential_write_stream.h"
#include "utilities/config.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace appendfs {

/// How an open for write is resolved against the existing backend file.
enum class OpenOutcome {
  Fresh,            ///< No file: create one.
  AwaitCompletion,  ///< Another writer holds it: wait, then re-classify.
  RecreateEmpty,    ///< Complete and O_TRUNC or empty: delete and re-create.
  DeferredExisting  ///< Complete, non-empty, no O_TRUNC: no output yet.
};

const char *outcomeName(OpenOutcome outcome);

/// Classify an open of a path whose current status is @p status.
OpenOutcome classifyOpen(const std::optional<FileInfo> &status, int flags);

/**
 * @brief Builds the streams behind the opens of one mount:
 * SequentialWriteStreams for writes, ReadStreams for read-only opens.
 *
 * The client, lock manager and auth policy must outlive the factory and
 * every stream it creates.
 */
class StreamFactory {
public:
  StreamFactory(RemoteFileClient &client, PathLockManager &locks,
                const AuthPolicy &auth, MountOptions options);

  /**
   * @brief Open @p uri for writing.
   * @param flags open(2) flags; O_TRUNC requests truncation.
   * @param mode Requested mode or MODE_NOT_SET.
   * @throws StreamException WriteConflict if the path is already open for
   *         write in this process, Unimplemented if another writer does not
   *         complete the file in time, RuntimeIO on backend failure. The
   *         path lock is released before any of these propagate.
   */
  std::unique_ptr<SequentialWriteStream>
  open(const std::string &uri, int flags, int64_t mode = MODE_NOT_SET);

  /**
   * @brief Open @p uri read-only under a READ lock.
   * @throws StreamException NotFound if the path does not exist,
   *         WriteConflict if it is open for write in this process.
   */
  std::unique_ptr<ReadStream> openForRead(const std::string &uri);

  /// Abort completion waits in progress and refuse new ones.
  void cancelPendingWaits() { cancelled_.store(true); }

  const MountOptions &options() const { return options_; }

private:
  FileInfo awaitCompletion(const std::string &uri);

  RemoteFileClient &client_;
  PathLockManager &locks_;
  const AuthPolicy &auth_;
  const MountOptions options_;
  std::atomic<bool> cancelled_{false};
};

} // namespace appendfs

#endif // APPENDFS_STREAM_FACTORY_H
