#include "client/in_memory_file_client.h"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <sodium.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace appendfs {

namespace {

std::string toHex(const unsigned char *digest, size_t len) {
  std::string hex;
  hex.reserve(len * 2);
  char buf[3];
  for (size_t i = 0; i < len; ++i) {
    std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
    hex += buf;
  }
  return hex;
}

std::string digestOf(const std::vector<char> &data) {
  unsigned char digest[crypto_hash_sha256_BYTES];
  crypto_hash_sha256(digest, reinterpret_cast<const unsigned char *>(data.data()),
                     data.size());
  return toHex(digest, sizeof(digest));
}

} // namespace

struct InMemoryFileClient::State {
  struct Entry {
    std::vector<char> data;
    FileInfo info;
    std::optional<WriteOptions> writeOptions;
    uint64_t generation{0};
  };

  mutable std::mutex mutex;
  std::condition_variable completion;
  std::unordered_map<std::string, Entry> files;
  uint64_t nextGeneration{1};
  bool failCreate{false};
  bool failDelete{false};
  bool failWrite{false};
  bool failFlush{false};
  bool failClose{false};
};

namespace {

/**
 * Appends into a private buffer and publishes to the shared entry on flush.
 * A handle whose file was deleted (or deleted and re-created) fails with
 * RuntimeIO instead of writing into someone else's file.
 */
class InMemoryOutputHandle : public OutputHandle {
public:
  InMemoryOutputHandle(std::shared_ptr<InMemoryFileClient::State> state,
                       std::string path, uint64_t generation)
      : state_(std::move(state)), path_(std::move(path)),
        generation_(generation) {
    crypto_hash_sha256_init(&sha_);
  }

  ~InMemoryOutputHandle() override = default;

  void write(const char *data, size_t size) override {
    if (closed_) {
      throwStreamError(StreamErrorCode::RuntimeIO,
                       "write on closed output handle for " + path_);
    }
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->failWrite) {
        throwStreamError(StreamErrorCode::RuntimeIO,
                         "injected write failure for " + path_);
      }
    }
    pending_.insert(pending_.end(), data, data + size);
    crypto_hash_sha256_update(&sha_, reinterpret_cast<const unsigned char *>(data),
                              size);
    bytesWritten_ += size;
  }

  void flush() override {
    if (closed_) {
      return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->failFlush) {
      throwStreamError(StreamErrorCode::RuntimeIO,
                       "injected flush failure for " + path_);
    }
    publishLocked();
  }

  uint64_t bytesWritten() const override { return bytesWritten_; }

  void close() override {
    if (closed_) {
      return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->failClose) {
      throwStreamError(StreamErrorCode::RuntimeIO,
                       "injected close failure for " + path_);
    }
    auto &entry = publishLocked();
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&sha_, digest);
    entry.info.completed = true;
    entry.info.contentDigest = toHex(digest, sizeof(digest));
    closed_ = true;
    state_->completion.notify_all();
    Logger::getInstance().log(LogLevel::DEBUG,
                              "[MEMCLIENT] Completed " + path_ + " with " +
                                  std::to_string(entry.data.size()) +
                                  " bytes");
  }

private:
  InMemoryFileClient::State::Entry &publishLocked() {
    auto it = state_->files.find(path_);
    if (it == state_->files.end() || it->second.generation != generation_) {
      throwStreamError(StreamErrorCode::RuntimeIO,
                       "file " + path_ + " was removed while being written");
    }
    auto &entry = it->second;
    entry.data.insert(entry.data.end(), pending_.begin(), pending_.end());
    entry.info.length = entry.data.size();
    pending_.clear();
    return entry;
  }

  std::shared_ptr<InMemoryFileClient::State> state_;
  std::string path_;
  uint64_t generation_;
  std::vector<char> pending_;
  uint64_t bytesWritten_{0};
  bool closed_{false};
  crypto_hash_sha256_state sha_;
};

} // namespace

InMemoryFileClient::InMemoryFileClient()
    : state_(std::make_shared<State>()) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

InMemoryFileClient::~InMemoryFileClient() = default;

std::optional<FileInfo>
InMemoryFileClient::getStatus(const std::string &path) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->files.find(path);
  if (it == state_->files.end()) {
    return std::nullopt;
  }
  return it->second.info;
}

std::optional<FileInfo>
InMemoryFileClient::waitForCompletion(const std::string &path,
                                      std::chrono::milliseconds timeout,
                                      std::chrono::milliseconds pollInterval,
                                      const std::atomic<bool> *cancel) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  // Completion notifies the condition variable; the slice only bounds how
  // late a cancellation is noticed.
  const auto slice = std::max(pollInterval, std::chrono::milliseconds(1));
  std::unique_lock<std::mutex> lock(state_->mutex);
  while (true) {
    auto it = state_->files.find(path);
    if (it == state_->files.end()) {
      return std::nullopt;
    }
    if (it->second.info.completed) {
      return it->second.info;
    }
    if (cancel && cancel->load()) {
      return std::nullopt;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    state_->completion.wait_until(lock, std::min(deadline, now + slice));
  }
}

std::unique_ptr<OutputHandle>
InMemoryFileClient::createFile(const std::string &path,
                               const CreateOptions &options) {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->failCreate) {
      throwStreamError(StreamErrorCode::RuntimeIO,
                       "injected create failure for " + path);
    }
    if (state_->files.count(path)) {
      throwStreamError(StreamErrorCode::AlreadyExists,
                       "cannot create " + path + ": file exists");
    }
    State::Entry entry;
    entry.info.path = path;
    entry.info.mode = options.mode;
    entry.info.uid = options.uid;
    entry.info.gid = options.gid;
    entry.writeOptions = options.writeOptions;
    entry.generation = state_->nextGeneration++;
    generation = entry.generation;
    state_->files.emplace(path, std::move(entry));
  }
  Logger::getInstance().log(LogLevel::DEBUG, "[MEMCLIENT] Created " + path);
  return std::make_unique<InMemoryOutputHandle>(state_, path, generation);
}

void InMemoryFileClient::deleteFile(const std::string &path) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->failDelete) {
      throwStreamError(StreamErrorCode::RuntimeIO,
                       "injected delete failure for " + path);
    }
    if (state_->files.erase(path) == 0) {
      throw StreamException(StreamErrorCode::NotFound,
                            "cannot delete " + path + ": no such file");
    }
    // Wake waiters so they observe the removal.
    state_->completion.notify_all();
  }
  Logger::getInstance().log(LogLevel::DEBUG, "[MEMCLIENT] Deleted " + path);
}

std::vector<char> InMemoryFileClient::readFile(const std::string &path,
                                               uint64_t offset, size_t size) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->files.find(path);
  if (it == state_->files.end()) {
    throw StreamException(StreamErrorCode::NotFound,
                          "cannot read " + path + ": no such file");
  }
  const auto &data = it->second.data;
  if (offset >= data.size()) {
    return {};
  }
  size_t n = std::min<uint64_t>(size, data.size() - offset);
  return std::vector<char>(data.begin() + offset, data.begin() + offset + n);
}

std::vector<FileInfo> InMemoryFileClient::listFiles() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  std::vector<FileInfo> out;
  out.reserve(state_->files.size());
  for (const auto &kv : state_->files) {
    out.push_back(kv.second.info);
  }
  std::sort(out.begin(), out.end(), [](const FileInfo &a, const FileInfo &b) {
    return a.path < b.path;
  });
  return out;
}

void InMemoryFileClient::putFile(const std::string &path,
                                 const std::string &content, uint32_t mode,
                                 bool completed) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  State::Entry entry;
  entry.data.assign(content.begin(), content.end());
  entry.info.path = path;
  entry.info.length = entry.data.size();
  entry.info.mode = mode;
  entry.info.completed = completed;
  if (completed) {
    entry.info.contentDigest = digestOf(entry.data);
  }
  entry.generation = state_->nextGeneration++;
  state_->files[path] = std::move(entry);
  state_->completion.notify_all();
}

void InMemoryFileClient::markIncomplete(const std::string &path) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->files.find(path);
  if (it != state_->files.end()) {
    it->second.info.completed = false;
    it->second.info.contentDigest.clear();
  }
}

void InMemoryFileClient::markComplete(const std::string &path) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->files.find(path);
  if (it != state_->files.end()) {
    it->second.info.completed = true;
    it->second.info.contentDigest = digestOf(it->second.data);
    state_->completion.notify_all();
  }
}

void InMemoryFileClient::setFailure(FailurePoint point, bool enabled) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  switch (point) {
  case FailurePoint::Create:
    state_->failCreate = enabled;
    break;
  case FailurePoint::Delete:
    state_->failDelete = enabled;
    break;
  case FailurePoint::Write:
    state_->failWrite = enabled;
    break;
  case FailurePoint::Flush:
    state_->failFlush = enabled;
    break;
  case FailurePoint::Close:
    state_->failClose = enabled;
    break;
  }
}

std::optional<WriteOptions>
InMemoryFileClient::writeOptionsOf(const std::string &path) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->files.find(path);
  if (it == state_->files.end()) {
    return std::nullopt;
  }
  return it->second.writeOptions;
}

std::string InMemoryFileClient::contentOf(const std::string &path) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto it = state_->files.find(path);
  if (it == state_->files.end()) {
    return {};
  }
  return std::string(it->second.data.begin(), it->second.data.end());
}

} // namespace appendfs
