#pragma once
#ifndef APPENDFS_FUSE_ADAPTER_H
#define APPENDFS_FUSE_ADAPTER_H

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif
#define FUSE_USE_VERSION 31

#include <fuse3/fuse.h>

#include "client/remote_file_client.h"
#include "lock/path_lock_manager.h"
#include "stream/auth_policy.h"
#include "stream/stream_factory.h"
#include "stream/stream_table.h"
#include "utilities/config.h"

#include <memory>

/**
 * @brief State shared by every FUSE callback of one mount.
 *
 * Passed as fuse private_data. Members are declared in dependency order so
 * streams (inside `streams`) are destroyed before the factory, the lock
 * manager and the client they reference.
 */
struct AppendFsFuseData {
  AppendFsFuseData(appendfs::RemoteFileClient &client,
                   const appendfs::MountOptions &options);

  appendfs::RemoteFileClient &client;
  appendfs::PathLockManager locks;
  std::unique_ptr<appendfs::AuthPolicy> auth;
  appendfs::StreamFactory factory;
  appendfs::StreamTable streams;
};

/**
 * @brief Make @p data the mount state seen by callbacks on this thread.
 *
 * Callbacks normally find their state through fuse_get_context(). While a
 * binding is alive they use @p data instead and treat the caller as the
 * current process, so the callbacks can be driven without a mounted session.
 * Bindings nest; the previous one is restored on destruction.
 */
class ScopedFuseDataBinding {
public:
  explicit ScopedFuseDataBinding(AppendFsFuseData *data);
  ~ScopedFuseDataBinding();
  ScopedFuseDataBinding(const ScopedFuseDataBinding &) = delete;
  ScopedFuseDataBinding &operator=(const ScopedFuseDataBinding &) = delete;

private:
  AppendFsFuseData *previous_;
};

int appendfs_getattr(const char *path, struct stat *stbuf,
                     struct fuse_file_info *fi);
int appendfs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                     off_t offset, struct fuse_file_info *fi,
                     enum fuse_readdir_flags flags);
int appendfs_create(const char *path, mode_t mode, struct fuse_file_info *fi);
int appendfs_open(const char *path, struct fuse_file_info *fi);
int appendfs_read(const char *path, char *buf, size_t size, off_t offset,
                  struct fuse_file_info *fi);
int appendfs_write(const char *path, const char *buf, size_t size, off_t offset,
                   struct fuse_file_info *fi);
int appendfs_truncate(const char *path, off_t size, struct fuse_file_info *fi);
int appendfs_flush(const char *path, struct fuse_file_info *fi);
int appendfs_release(const char *path, struct fuse_file_info *fi);
int appendfs_unlink(const char *path);
void appendfs_destroy(void *private_data);

/// Operation table wiring the callbacks above.
struct fuse_operations appendfs_operations();

/**
 * @brief Clamp negative offsets to zero.
 *
 * FUSE may pass a negative offset when the file position is unknown; the
 * streams expect non-negative offsets.
 */
inline off_t sanitize_offset(off_t offset) { return offset < 0 ? 0 : offset; }

#endif // APPENDFS_FUSE_ADAPTER_H
