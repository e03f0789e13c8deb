#include "lock/path_lock_manager.h"
#include "utilities/errors.h"
#include "utilities/logger.h"

namespace appendfs {

LockHandle::~LockHandle() { release(); }

void LockHandle::release() {
  if (!held_) {
    return;
  }
  held_ = false;
  manager_->unlock(key_, mode_);
}

bool PathLockManager::compatible(const Entry &entry, LockMode mode) {
  if (entry.writer) {
    return false;
  }
  return mode == LockMode::READ || entry.readers == 0;
}

std::unique_ptr<LockHandle>
PathLockManager::tryLock(const std::string &key, LockMode mode,
                         std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto ready = [&] {
    auto it = entries_.find(key);
    return it == entries_.end() || compatible(it->second, mode);
  };
  if (!ready()) {
    if (timeout.count() <= 0 ||
        !released_.wait_for(lock, timeout, ready)) {
      lock.unlock();
      throwStreamError(StreamErrorCode::WriteConflict,
                       "Failed to lock " + key + " for " +
                           (mode == LockMode::WRITE ? "write" : "read") +
                           ": path is in use by another open file");
    }
  }
  auto &entry = entries_[key];
  if (mode == LockMode::WRITE) {
    entry.writer = true;
  } else {
    ++entry.readers;
  }
  return std::make_unique<LockHandle>(LockHandle::Key{}, this, key, mode);
}

void PathLockManager::unlock(const std::string &key, LockMode mode) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      Logger::getInstance().log(LogLevel::WARN,
                                "[LOCK] Release of unlocked path " + key);
      return;
    }
    if (mode == LockMode::WRITE) {
      it->second.writer = false;
    } else if (it->second.readers > 0) {
      --it->second.readers;
    }
    if (!it->second.writer && it->second.readers == 0) {
      entries_.erase(it);
    }
  }
  released_.notify_all();
}

bool PathLockManager::isLocked(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(key) > 0;
}

size_t PathLockManager::lockedPathCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace appendfs
