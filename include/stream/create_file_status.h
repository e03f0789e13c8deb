#pragma once
#ifndef APPENDFS_CREATE_FILE_STATUS_H
#define APPENDFS_CREATE_FILE_STATUS_H

#include <cstdint>

namespace appendfs {

class AuthPolicy;

/// Mode argument meaning "caller did not supply one".
constexpr int64_t MODE_NOT_SET = -1;

/**
 * @brief Attributes of the file a write stream owns.
 *
 * The length is logical: after a growing truncate it runs ahead of the
 * bytes physically written until close() pads the gap with zeroes.
 */
class CreateFileStatus {
public:
  /**
   * @brief Resolve mode and owner for a file being opened for write.
   * @param auth Supplies uid/gid.
   * @param mode Requested mode, or MODE_NOT_SET to use @p defaultMode.
   * @param length Initial logical length.
   * @param defaultMode Permission bits used when @p mode is unset.
   */
  static CreateFileStatus create(const AuthPolicy &auth, int64_t mode,
                                 uint64_t length, uint32_t defaultMode);

  CreateFileStatus(uint64_t length, uint32_t mode, uint32_t uid, uint32_t gid);

  uint64_t getFileLength() const { return length_; }
  void setFileLength(uint64_t length) { length_ = length; }
  uint32_t getMode() const { return mode_; }
  uint32_t getUid() const { return uid_; }
  uint32_t getGid() const { return gid_; }

private:
  uint64_t length_;
  uint32_t mode_;
  uint32_t uid_;
  uint32_t gid_;
};

} // namespace appendfs

#endif // APPENDFS_CREATE_FILE_STATUS_H
