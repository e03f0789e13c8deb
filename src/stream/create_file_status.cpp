#include "stream/create_file_status.h"
#include "stream/auth_policy.h"

#include <sys/stat.h>

namespace appendfs {

CreateFileStatus::CreateFileStatus(uint64_t length, uint32_t mode, uint32_t uid,
                                   uint32_t gid)
    : length_(length), mode_(mode), uid_(uid), gid_(gid) {
  // Files created through a write stream are always regular files.
  if ((mode_ & S_IFMT) == 0) {
    mode_ |= S_IFREG;
  }
}

CreateFileStatus CreateFileStatus::create(const AuthPolicy &auth, int64_t mode,
                                          uint64_t length,
                                          uint32_t defaultMode) {
  uint32_t resolved =
      mode == MODE_NOT_SET ? defaultMode : static_cast<uint32_t>(mode);
  Owner owner = auth.owner();
  return CreateFileStatus(length, resolved, owner.uid, owner.gid);
}

} // namespace appendfs
