#include "utilities/fuse_adapter.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/open_flags.h"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <span>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace appendfs;

namespace {

// Set by ScopedFuseDataBinding. Checked before fuse_get_context(), which must
// not be called on a thread that no FUSE session owns.
thread_local AppendFsFuseData *bound_fuse_data = nullptr;

std::optional<Owner> fuseCallerOwner() {
  if (bound_fuse_data) {
    return std::nullopt;
  }
  fuse_context *ctx = fuse_get_context();
  if (!ctx) {
    return std::nullopt;
  }
  return Owner{static_cast<uint32_t>(ctx->uid), static_cast<uint32_t>(ctx->gid)};
}

AppendFsFuseData *get_fuse_data() {
  if (bound_fuse_data) {
    return bound_fuse_data;
  }
  fuse_context *context = fuse_get_context();
  if (!context || !context->private_data) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "[FUSE_ADAPTER] FUSE private_data is null.");
    return nullptr;
  }
  return static_cast<AppendFsFuseData *>(context->private_data);
}

/**
 * Run one callback body, turning exceptions into -errno. Expected stream
 * failures (conflicts, unsupported patterns) are logged at DEBUG since the
 * stream already logged them.
 */
template <typename Fn>
int run_op(const char *op, const std::string &path, Fn &&fn) {
  ScopedLatency latency(op);
  try {
    return fn();
  } catch (const StreamException &e) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              std::string("[FUSE_ADAPTER] ") + op + " " +
                                  path + " failed: " + e.what());
    return -toErrno(e.code());
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("[FUSE_ADAPTER] ") + op + " " +
                                  path + " raised: " + e.what());
    return -errnoForException(e);
  }
}

void fill_stat(struct stat *stbuf, uint64_t length, uint32_t mode, uint32_t uid,
               uint32_t gid) {
  stbuf->st_mode = static_cast<mode_t>(mode);
  stbuf->st_uid = static_cast<uid_t>(uid);
  stbuf->st_gid = static_cast<gid_t>(gid);
  stbuf->st_size = static_cast<off_t>(length);
  stbuf->st_nlink = 1;
  stbuf->st_atime = stbuf->st_mtime = stbuf->st_ctime = time(nullptr);
}

int open_write_stream(AppendFsFuseData *data, const std::string &path,
                      int flags, int64_t mode, struct fuse_file_info *fi) {
  std::shared_ptr<FileStream> stream = data->factory.open(path, flags, mode);
  fi->fh = data->streams.add(path, std::move(stream));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[FUSE_ADAPTER] Opened " + path +
                                " for write as fh " + std::to_string(fi->fh));
  return 0;
}

} // namespace

ScopedFuseDataBinding::ScopedFuseDataBinding(AppendFsFuseData *data)
    : previous_(bound_fuse_data) {
  bound_fuse_data = data;
}

ScopedFuseDataBinding::~ScopedFuseDataBinding() { bound_fuse_data = previous_; }

AppendFsFuseData::AppendFsFuseData(RemoteFileClient &c,
                                   const MountOptions &options)
    : client(c), auth(makeAuthPolicy(options, fuseCallerOwner)),
      factory(c, locks, *auth, options) {}

int appendfs_getattr(const char *path, struct stat *stbuf,
                     struct fuse_file_info *fi) {
  std::string path_str(path);
  memset(stbuf, 0, sizeof(struct stat));
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  if (path_str == "/") {
    stbuf->st_mode = S_IFDIR | 0755;
    stbuf->st_nlink = 2;
    stbuf->st_uid = getuid();
    stbuf->st_gid = getgid();
    stbuf->st_atime = stbuf->st_mtime = stbuf->st_ctime = time(nullptr);
    return 0;
  }
  return run_op("getattr", path_str, [&] {
    // A file open for write reports its live (possibly virtual) length.
    std::shared_ptr<FileStream> stream =
        fi && fi->fh ? data->streams.find(fi->fh) : nullptr;
    if (!stream) {
      stream = data->streams.findWriterByPath(path_str);
    }
    if (stream && !stream->isClosed()) {
      CreateFileStatus st = stream->getStatus();
      fill_stat(stbuf, st.getFileLength(), st.getMode(), st.getUid(),
                st.getGid());
      return 0;
    }
    std::optional<FileInfo> info = data->client.getStatus(path_str);
    if (!info) {
      return -ENOENT;
    }
    fill_stat(stbuf, info->length, info->mode, info->uid, info->gid);
    return 0;
  });
}

int appendfs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                     off_t offset, struct fuse_file_info *fi,
                     enum fuse_readdir_flags flags) {
  (void)offset;
  (void)fi;
  (void)flags;
  std::string path_str(path);
  if (path_str != "/") {
    return -ENOENT;
  }
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  return run_op("readdir", path_str, [&] {
    filler(buf, ".", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    filler(buf, "..", nullptr, 0, static_cast<fuse_fill_dir_flags>(0));
    for (const FileInfo &info : data->client.listFiles()) {
      // The namespace is flat: every file lives directly under the root.
      std::string name = info.path.substr(info.path.rfind('/') + 1);
      if (!name.empty()) {
        filler(buf, name.c_str(), nullptr, 0,
               static_cast<fuse_fill_dir_flags>(0));
      }
    }
    return 0;
  });
}

int appendfs_create(const char *path, mode_t mode, struct fuse_file_info *fi) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  if (path_str == "/") {
    return -EISDIR;
  }
  return run_op("create", path_str, [&] {
    return open_write_stream(data, path_str, fi->flags,
                             static_cast<int64_t>(mode), fi);
  });
}

int appendfs_open(const char *path, struct fuse_file_info *fi) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  return run_op("open", path_str, [&] {
    if (isReadOnlyOpen(fi->flags)) {
      std::shared_ptr<FileStream> stream = data->factory.openForRead(path_str);
      fi->fh = data->streams.add(path_str, std::move(stream));
      Logger::getInstance().log(LogLevel::DEBUG,
                                "[FUSE_ADAPTER] Opened " + path_str +
                                    " for read as fh " + std::to_string(fi->fh));
      return 0;
    }
    return open_write_stream(data, path_str, fi->flags, MODE_NOT_SET, fi);
  });
}

int appendfs_read(const char *path, char *buf, size_t size, off_t offset,
                  struct fuse_file_info *fi) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  return run_op("read", path_str, [&] {
    std::shared_ptr<FileStream> stream = data->streams.find(fi->fh);
    if (!stream) {
      Logger::getInstance().log(LogLevel::WARN,
                                "[FUSE_ADAPTER] read of " + path_str +
                                    " with no stream for fh " +
                                    std::to_string(fi->fh));
      return -EBADF;
    }
    return static_cast<int>(
        stream->read(std::span<char>(buf, size), static_cast<int64_t>(size),
                     sanitize_offset(offset)));
  });
}

int appendfs_write(const char *path, const char *buf, size_t size, off_t offset,
                   struct fuse_file_info *fi) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  return run_op("write", path_str, [&] {
    std::shared_ptr<FileStream> stream = data->streams.find(fi->fh);
    if (!stream) {
      Logger::getInstance().log(LogLevel::WARN,
                                "[FUSE_ADAPTER] write to " + path_str +
                                    " with no stream for fh " +
                                    std::to_string(fi->fh));
      return -EBADF;
    }
    stream->write(std::span<const char>(buf, size), static_cast<int64_t>(size),
                  sanitize_offset(offset));
    return static_cast<int>(size);
  });
}

int appendfs_truncate(const char *path, off_t size, struct fuse_file_info *fi) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  return run_op("truncate", path_str, [&] {
    std::shared_ptr<FileStream> stream =
        fi && fi->fh ? data->streams.find(fi->fh) : nullptr;
    if (!stream) {
      stream = data->streams.findWriterByPath(path_str);
    }
    if (stream) {
      stream->truncate(static_cast<int64_t>(size));
      return 0;
    }
    // truncate(2) on a path that is not open: use a short-lived stream.
    std::unique_ptr<SequentialWriteStream> transient =
        data->factory.open(path_str, O_WRONLY);
    transient->truncate(static_cast<int64_t>(size));
    transient->close();
    return 0;
  });
}

int appendfs_flush(const char *path, struct fuse_file_info *fi) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  return run_op("flush", path_str, [&] {
    if (std::shared_ptr<FileStream> stream = data->streams.find(fi->fh)) {
      stream->flush();
    }
    return 0;
  });
}

int appendfs_release(const char *path, struct fuse_file_info *fi) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  return run_op("release", path_str, [&] {
    std::shared_ptr<FileStream> stream = data->streams.remove(fi->fh);
    if (stream) {
      stream->close();
      Logger::getInstance().log(LogLevel::DEBUG,
                                "[FUSE_ADAPTER] Released fh " +
                                    std::to_string(fi->fh) + " for " +
                                    path_str);
    }
    return 0;
  });
}

int appendfs_unlink(const char *path) {
  std::string path_str(path);
  AppendFsFuseData *data = get_fuse_data();
  if (!data) {
    return -EIO;
  }
  if (path_str == "/") {
    return -EISDIR;
  }
  return run_op("unlink", path_str, [&] {
    if (data->locks.isLocked(path_str)) {
      return -EBUSY;
    }
    data->client.deleteFile(path_str);
    return 0;
  });
}

void appendfs_destroy(void *private_data) {
  if (!private_data) {
    return;
  }
  auto *data = static_cast<AppendFsFuseData *>(private_data);
  data->factory.cancelPendingWaits();
  for (auto &kv : data->streams.drain()) {
    try {
      kv.second->close();
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "[FUSE_ADAPTER] Closing fh " +
                                    std::to_string(kv.first) +
                                    " on unmount failed: " + e.what());
    }
  }
  Logger::getInstance().log(LogLevel::INFO, "[FUSE_ADAPTER] Unmounted.");
}

struct fuse_operations appendfs_operations() {
  struct fuse_operations ops;
  memset(&ops, 0, sizeof(struct fuse_operations));
  ops.getattr = appendfs_getattr;
  ops.readdir = appendfs_readdir;
  ops.create = appendfs_create;
  ops.open = appendfs_open;
  ops.read = appendfs_read;
  ops.write = appendfs_write;
  ops.truncate = appendfs_truncate;
  ops.flush = appendfs_flush;
  ops.release = appendfs_release;
  ops.unlink = appendfs_unlink;
  ops.destroy = appendfs_destroy;
  return ops;
}
