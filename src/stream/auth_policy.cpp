#include "stream/auth_policy.h"
#include "utilities/config.h"

#include <unistd.h>

namespace appendfs {

SystemAuthPolicy::SystemAuthPolicy(ContextProvider provider)
    : provider_(std::move(provider)) {}

Owner SystemAuthPolicy::owner() const {
  if (provider_) {
    if (auto ctx = provider_()) {
      return *ctx;
    }
  }
  return Owner{static_cast<uint32_t>(getuid()),
               static_cast<uint32_t>(getgid())};
}

std::unique_ptr<AuthPolicy>
makeAuthPolicy(const MountOptions &opts,
               SystemAuthPolicy::ContextProvider provider) {
  if (opts.authPolicy == "custom") {
    return std::make_unique<CustomAuthPolicy>(opts.customUid, opts.customGid);
  }
  return std::make_unique<SystemAuthPolicy>(std::move(provider));
}

} // namespace appendfs
