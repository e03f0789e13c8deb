#include "stream/read_stream.h"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <cstring>
#include <vector>

namespace appendfs {

ReadStream::ReadStream(RemoteFileClient &client, std::string uri,
                       std::unique_ptr<LockHandle> lock)
    : client_(client), uri_(std::move(uri)), lock_(std::move(lock)) {}

ReadStream::~ReadStream() { close(); }

FileInfo ReadStream::currentInfo() {
  std::optional<FileInfo> info = wrapBackendCall(
      "get status of " + uri_, [&] { return client_.getStatus(uri_); });
  if (!info) {
    throwStreamError(StreamErrorCode::NotFound,
                     "File " + uri_ + " no longer exists");
  }
  return *info;
}

int64_t ReadStream::read(std::span<char> buf, int64_t size, int64_t offset) {
  if (size < 0 || offset < 0 || static_cast<uint64_t>(size) > buf.size()) {
    throwStreamError(StreamErrorCode::InvalidArgument,
                     "Invalid read of " + uri_ +
                         ": buffer capacity=" + std::to_string(buf.size()) +
                         " offset=" + std::to_string(offset) +
                         " size=" + std::to_string(size));
  }
  if (closed_.load()) {
    throwStreamError(StreamErrorCode::InvalidArgument,
                     "Cannot read from closed stream " + uri_);
  }
  if (!currentInfo().completed) {
    // Content of a file still being written is not stable.
    throwStreamError(StreamErrorCode::WriteConflict,
                     "Cannot read " + uri_ + " before its writer completes it");
  }
  std::vector<char> bytes = wrapBackendCall("read " + uri_, [&] {
    return client_.readFile(uri_, static_cast<uint64_t>(offset),
                            static_cast<size_t>(size));
  });
  if (!bytes.empty()) {
    std::memcpy(buf.data(), bytes.data(), bytes.size());
  }
  return static_cast<int64_t>(bytes.size());
}

void ReadStream::write(std::span<const char> buf, int64_t size,
                       int64_t offset) {
  (void)buf;
  (void)size;
  (void)offset;
  throwStreamError(StreamErrorCode::UnsupportedOperation,
                   "Cannot write to read only stream " + uri_);
}

void ReadStream::truncate(int64_t size) {
  throwStreamError(StreamErrorCode::UnsupportedOperation,
                   "Cannot truncate " + uri_ + " to " + std::to_string(size) +
                       " through a read only stream");
}

CreateFileStatus ReadStream::getStatus() {
  FileInfo info = currentInfo();
  return CreateFileStatus(info.length, info.mode, info.uid, info.gid);
}

void ReadStream::close() {
  if (closed_.exchange(true)) {
    return;
  }
  if (lock_) {
    lock_->release();
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[STREAM] Closed read stream of " + uri_);
}

} // namespace appendfs
