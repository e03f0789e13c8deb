#pragma once
#ifndef APPENDFS_PATH_LOCK_MANAGER_H
#define APPENDFS_PATH_LOCK_MANAGER_H

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace appendfs {

enum class LockMode { READ, WRITE };

class PathLockManager;

/**
 * @brief Held path lock. Released by release() or on destruction.
 *
 * The owning PathLockManager must outlive every handle it issued.
 */
class LockHandle {
public:
  /// Only PathLockManager can construct a Key, and so a LockHandle.
  class Key {
    friend class PathLockManager;
    Key() = default;
  };

  LockHandle(Key, PathLockManager *manager, std::string key, LockMode mode)
      : manager_(manager), key_(std::move(key)), mode_(mode) {}
  ~LockHandle();
  LockHandle(const LockHandle &) = delete;
  LockHandle &operator=(const LockHandle &) = delete;

  /// Release the lock. Calling it again is a no-op.
  void release();
  bool isHeld() const { return held_; }
  const std::string &key() const { return key_; }
  LockMode mode() const { return mode_; }

private:
  PathLockManager *manager_;
  std::string key_;
  LockMode mode_;
  bool held_{true};
};

/**
 * @brief Per-path reader/writer locks shared by every open file of a mount.
 *
 * Any number of READ holders or a single WRITE holder may own a path.
 * Entries exist only while held.
 */
class PathLockManager {
public:
  /**
   * @brief Acquire @p key in @p mode.
   * @param timeout How long to wait for a conflicting holder to release.
   *        Zero fails immediately.
   * @throws StreamException(WriteConflict) if the lock is not obtained.
   */
  std::unique_ptr<LockHandle>
  tryLock(const std::string &key, LockMode mode,
          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  bool isLocked(const std::string &key) const;
  size_t lockedPathCount() const;

private:
  friend class LockHandle;
  struct Entry {
    int readers{0};
    bool writer{false};
  };

  void unlock(const std::string &key, LockMode mode);
  static bool compatible(const Entry &entry, LockMode mode);

  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace appendfs

#endif // APPENDFS_PATH_LOCK_MANAGER_H
