#include "stream/sequential_write_stream.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <vector>

namespace appendfs {

SequentialWriteStream::SequentialWriteStream(
    RemoteFileClient &client, std::string uri, CreateFileStatus status,
    std::unique_ptr<LockHandle> lock, std::unique_ptr<OutputHandle> output,
    StreamSettings settings)
    : client_(client), uri_(std::move(uri)), status_(status),
      lock_(std::move(lock)), output_(std::move(output)),
      settings_(std::move(settings)) {
  MetricsRegistry::instance().addToGauge("appendfs_open_write_streams", 1);
}

SequentialWriteStream::~SequentialWriteStream() {
  if (closed_.load()) {
    return;
  }
  try {
    close();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "[STREAM] Implicit close of " + uri_ +
                                  " failed: " + e.what());
  }
}

int64_t SequentialWriteStream::read(std::span<char> buf, int64_t size,
                                    int64_t offset) {
  (void)buf;
  (void)size;
  (void)offset;
  throwStreamError(StreamErrorCode::UnsupportedOperation,
                   "Cannot read from write only stream " + uri_);
}

void SequentialWriteStream::write(std::span<const char> buf, int64_t size,
                                  int64_t offset) {
  if (size < 0 || offset < 0 || static_cast<uint64_t>(size) > buf.size()) {
    throwStreamError(StreamErrorCode::InvalidArgument,
                     "Invalid write to " + uri_ +
                         ": buffer capacity=" + std::to_string(buf.size()) +
                         " offset=" + std::to_string(offset) +
                         " size=" + std::to_string(size));
  }
  std::lock_guard<std::mutex> guard(mutex_);
  if (closed_.load()) {
    throwStreamError(StreamErrorCode::InvalidArgument,
                     "Cannot write to closed stream " + uri_);
  }
  if (!output_) {
    throwStreamError(StreamErrorCode::AlreadyExists,
                     "Cannot overwrite or extend existing file " + uri_ +
                         " without O_TRUNC flag or truncate(0) operation");
  }
  if (size == 0) {
    return;
  }

  const uint64_t written = output_->bytesWritten();
  const uint64_t start = static_cast<uint64_t>(offset);
  const uint64_t end = start + static_cast<uint64_t>(size);
  if (start != written && end > written) {
    throwStreamError(StreamErrorCode::Unimplemented,
                     "Only sequential write is supported. Cannot write " +
                         std::to_string(size) + " bytes to offset " +
                         std::to_string(offset) + " when " +
                         std::to_string(written) +
                         " bytes have been written to " + uri_);
  }
  if (end <= written) {
    // Editors such as vim re-flush a prefix they already wrote.
    Logger::getInstance().log(
        LogLevel::WARN, "[STREAM] Skip writing to " + uri_ +
                            " offset=" + std::to_string(offset) +
                            " size=" + std::to_string(size) + " when " +
                            std::to_string(written) +
                            " bytes have been written");
    MetricsRegistry::instance().incrementCounter(
        "appendfs_stream_rewrites_skipped_total");
    return;
  }

  wrapBackendCall("write to " + uri_, [&] {
    output_->write(buf.data(), static_cast<size_t>(size));
  });
  MetricsRegistry::instance().incrementCounter(
      "appendfs_stream_bytes_written_total", static_cast<double>(size));
}

void SequentialWriteStream::truncate(int64_t size) {
  if (size < 0) {
    throwStreamError(StreamErrorCode::InvalidArgument,
                     "Cannot truncate " + uri_ + " to negative size " +
                         std::to_string(size));
  }
  std::lock_guard<std::mutex> guard(mutex_);
  if (closed_.load()) {
    throwStreamError(StreamErrorCode::InvalidArgument,
                     "Cannot truncate closed stream " + uri_);
  }
  const uint64_t target = static_cast<uint64_t>(size);
  const uint64_t current = refreshStatusLocked().getFileLength();
  if (target == current) {
    return;
  }

  if (target == 0) {
    if (output_) {
      // The old content is discarded, so no padding is written.
      std::unique_ptr<OutputHandle> old = std::move(output_);
      wrapBackendCall("close " + uri_, [&] { old->close(); });
    }
    try {
      wrapBackendCall("delete " + uri_, [&] { client_.deleteFile(uri_); });
    } catch (const StreamException &e) {
      if (e.code() != StreamErrorCode::NotFound) {
        throw;
      }
      Logger::getInstance().log(LogLevel::DEBUG,
                                "[STREAM] " + uri_ +
                                    " already absent during truncate(0)");
    }
    status_.setFileLength(0);
    output_ = createOutputLocked();
    Logger::getInstance().log(LogLevel::DEBUG,
                              "[STREAM] Truncated " + uri_ +
                                  " to 0 and re-created it for writing");
    return;
  }

  if (output_ && target >= output_->bytesWritten()) {
    // create -> write -> truncate(larger) -> write is supported; extending
    // a file that existed before this open is not.
    status_.setFileLength(target);
    return;
  }

  throwStreamError(StreamErrorCode::Unimplemented,
                   "Cannot truncate file " + uri_ + " from size " +
                       std::to_string(current) + " to size " +
                       std::to_string(target));
}

void SequentialWriteStream::flush() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (closed_.load() || !output_) {
    return;
  }
  wrapBackendCall("flush " + uri_, [&] { output_->flush(); });
}

CreateFileStatus SequentialWriteStream::getStatus() {
  std::lock_guard<std::mutex> guard(mutex_);
  return refreshStatusLocked();
}

void SequentialWriteStream::close() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (closed_.load()) {
    return;
  }
  closed_.store(true);
  MetricsRegistry::instance().addToGauge("appendfs_open_write_streams", -1);
  // Released when this scope exits, whether or not the output closes.
  std::unique_ptr<LockHandle> lock = std::move(lock_);
  closeOutputLocked();
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[STREAM] Closed " + uri_ + " with length " +
                                std::to_string(status_.getFileLength()));
}

bool SequentialWriteStream::isDeferred() {
  std::lock_guard<std::mutex> guard(mutex_);
  return !closed_.load() && !output_;
}

CreateFileStatus SequentialWriteStream::refreshStatusLocked() {
  if (output_ && output_->bytesWritten() > status_.getFileLength()) {
    status_.setFileLength(output_->bytesWritten());
  }
  return status_;
}

void SequentialWriteStream::closeOutputLocked() {
  if (!output_) {
    return;
  }
  refreshStatusLocked();
  fillZerosLocked();
  wrapBackendCall("close " + uri_, [&] { output_->close(); });
  output_.reset();
}

void SequentialWriteStream::fillZerosLocked() {
  const uint64_t written = output_->bytesWritten();
  const uint64_t length = status_.getFileLength();
  if (written >= length) {
    return;
  }
  const uint64_t gap = length - written;
  const uint64_t chunkLimit =
      std::max<uint64_t>(1, settings_.zeroFillChunkBytes);
  const std::vector<char> zeros(
      static_cast<size_t>(std::min<uint64_t>(gap, chunkLimit)), 0);
  uint64_t remaining = gap;
  while (remaining > 0) {
    size_t chunk =
        static_cast<size_t>(std::min<uint64_t>(remaining, zeros.size()));
    wrapBackendCall("zero-fill " + uri_,
                    [&] { output_->write(zeros.data(), chunk); });
    remaining -= chunk;
  }
  MetricsRegistry::instance().incrementCounter(
      "appendfs_stream_zero_fill_bytes_total", static_cast<double>(gap));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[STREAM] Filled " + std::to_string(gap) +
                                " zero bytes to " + uri_ +
                                " to reach the extended length of " +
                                std::to_string(length));
}

std::unique_ptr<OutputHandle> SequentialWriteStream::createOutputLocked() {
  CreateOptions options;
  options.mode = status_.getMode();
  options.uid = status_.getUid();
  options.gid = status_.getGid();
  options.writeOptions = settings_.writeOptions;
  return wrapBackendCall("create " + uri_,
                         [&] { return client_.createFile(uri_, options); });
}

} // namespace appendfs
