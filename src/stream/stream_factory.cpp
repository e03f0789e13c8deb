#include "stream/stream_factory.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/open_flags.h"

#include <sstream>

namespace appendfs {

const char *outcomeName(OpenOutcome outcome) {
  switch (outcome) {
  case OpenOutcome::Fresh:
    return "fresh";
  case OpenOutcome::AwaitCompletion:
    return "await_completion";
  case OpenOutcome::RecreateEmpty:
    return "recreate_empty";
  case OpenOutcome::DeferredExisting:
    return "deferred_existing";
  }
  return "unknown";
}

OpenOutcome classifyOpen(const std::optional<FileInfo> &status, int flags) {
  if (!status) {
    return OpenOutcome::Fresh;
  }
  if (!status->completed) {
    return OpenOutcome::AwaitCompletion;
  }
  if (containsTruncate(flags) || status->length == 0) {
    return OpenOutcome::RecreateEmpty;
  }
  return OpenOutcome::DeferredExisting;
}

StreamFactory::StreamFactory(RemoteFileClient &client, PathLockManager &locks,
                             const AuthPolicy &auth, MountOptions options)
    : client_(client), locks_(locks), auth_(auth),
      options_(std::move(options)) {}

FileInfo StreamFactory::awaitCompletion(const std::string &uri) {
  Logger::getInstance().log(
      LogLevel::INFO, "[FACTORY] " + uri +
                          " is being written by another client, waiting up "
                          "to " +
                          std::to_string(options_.completionWaitTimeout.count()) +
                          " ms for it to complete");
  std::optional<FileInfo> status;
  if (!cancelled_.load()) {
    status = wrapBackendCall("wait for completion of " + uri, [&] {
      return client_.waitForCompletion(uri, options_.completionWaitTimeout,
                                       options_.completionPollInterval,
                                       &cancelled_);
    });
  }
  if (!status) {
    throwStreamError(StreamErrorCode::Unimplemented,
                     "Failed to create fuse file out stream for " + uri +
                         ": cannot concurrently write same file");
  }
  return *status;
}

std::unique_ptr<SequentialWriteStream>
StreamFactory::open(const std::string &uri, int flags, int64_t mode) {
  // Make sure the file is not being written through this mount.
  std::unique_ptr<LockHandle> lock =
      locks_.tryLock(uri, LockMode::WRITE, options_.lockTimeout);

  // From here on `lock` is released by unwinding if anything throws.
  std::optional<FileInfo> status = wrapBackendCall(
      "get status of " + uri, [&] { return client_.getStatus(uri); });

  OpenOutcome outcome = classifyOpen(status, flags);
  if (outcome == OpenOutcome::AwaitCompletion) {
    // Another client outside this mount is writing it.
    status = awaitCompletion(uri);
    outcome = classifyOpen(status, flags);
  }

  if (mode == MODE_NOT_SET && status) {
    mode = status->mode;
  }
  const uint64_t existingLength = status ? status->length : 0;
  CreateFileStatus fileStatus = CreateFileStatus::create(
      auth_, mode, existingLength, options_.defaultFileMode);
  StreamSettings settings{options_.writeOptions, options_.zeroFillChunkBytes};

  MetricsRegistry::instance().incrementCounter(
      "appendfs_stream_open_total", 1, {{"outcome", outcomeName(outcome)}});

  std::unique_ptr<OutputHandle> output;
  switch (outcome) {
  case OpenOutcome::DeferredExisting:
    // Supports open(O_WRONLY or O_RDWR) -> truncate(0) -> write().
    Logger::getInstance().log(
        LogLevel::DEBUG, "[FACTORY] Opened existing " + uri + " of length " +
                             std::to_string(existingLength) +
                             " without O_TRUNC; output deferred until "
                             "truncate(0)");
    return std::make_unique<SequentialWriteStream>(
        client_, uri, fileStatus, std::move(lock), nullptr,
        std::move(settings));
  case OpenOutcome::RecreateEmpty: {
    wrapBackendCall("delete " + uri, [&] { client_.deleteFile(uri); });
    fileStatus.setFileLength(0);
    std::ostringstream msg;
    msg << "[FACTORY] Open path " << uri << " with flag 0x" << std::hex
        << flags << " for overwriting; deleted the old file";
    Logger::getInstance().log(LogLevel::DEBUG, msg.str());
    break;
  }
  case OpenOutcome::Fresh:
    break;
  case OpenOutcome::AwaitCompletion:
    // classifyOpen never returns this for a completed status.
    throwStreamError(StreamErrorCode::RuntimeIO,
                     "unexpected incomplete status for " + uri);
  }

  CreateOptions createOptions;
  createOptions.mode = fileStatus.getMode();
  createOptions.uid = fileStatus.getUid();
  createOptions.gid = fileStatus.getGid();
  createOptions.writeOptions = options_.writeOptions;
  output = wrapBackendCall("create " + uri, [&] {
    return client_.createFile(uri, createOptions);
  });
  return std::make_unique<SequentialWriteStream>(
      client_, uri, fileStatus, std::move(lock), std::move(output),
      std::move(settings));
}

std::unique_ptr<ReadStream> StreamFactory::openForRead(const std::string &uri) {
  std::unique_ptr<LockHandle> lock =
      locks_.tryLock(uri, LockMode::READ, options_.lockTimeout);
  std::optional<FileInfo> status = wrapBackendCall(
      "get status of " + uri, [&] { return client_.getStatus(uri); });
  if (!status) {
    throwStreamError(StreamErrorCode::NotFound,
                     "Cannot open " + uri + " for read: no such file");
  }
  MetricsRegistry::instance().incrementCounter("appendfs_stream_open_total", 1,
                                               {{"outcome", "read"}});
  return std::make_unique<ReadStream>(client_, uri, std::move(lock));
}

} // namespace appendfs
