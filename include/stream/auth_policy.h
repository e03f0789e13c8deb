#pragma once
#ifndef APPENDFS_AUTH_POLICY_H
#define APPENDFS_AUTH_POLICY_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace appendfs {

struct MountOptions;

struct Owner {
  uint32_t uid{0};
  uint32_t gid{0};
};

/// Decides who owns the files a mount creates.
class AuthPolicy {
public:
  virtual ~AuthPolicy() = default;
  virtual Owner owner() const = 0;
};

/**
 * @brief Owner of the process making the request.
 *
 * The context provider returns the requesting uid/gid (the FUSE layer passes
 * one reading fuse_get_context()); when it is unset or returns nothing, the
 * mount process's own ids are used.
 */
class SystemAuthPolicy : public AuthPolicy {
public:
  using ContextProvider = std::function<std::optional<Owner>()>;

  explicit SystemAuthPolicy(ContextProvider provider = {});
  Owner owner() const override;

private:
  ContextProvider provider_;
};

/// Fixed owner taken from configuration.
class CustomAuthPolicy : public AuthPolicy {
public:
  CustomAuthPolicy(uint32_t uid, uint32_t gid) : owner_{uid, gid} {}
  Owner owner() const override { return owner_; }

private:
  Owner owner_;
};

std::unique_ptr<AuthPolicy>
makeAuthPolicy(const MountOptions &opts,
               SystemAuthPolicy::ContextProvider provider = {});

} // namespace appendfs

#endif // APPENDFS_AUTH_POLICY_H
