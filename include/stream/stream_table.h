#pragma once
#ifndef APPENDFS_STREAM_TABLE_H
#define APPENDFS_STREAM_TABLE_H

#include "stream/file_stream.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace appendfs {

/**
 * @brief Open streams of a mount indexed by the FUSE file handle.
 *
 * Handles start at 1; 0 is left for opens that need no stream. Streams are
 * shared so an operation in flight keeps its stream alive while release()
 * removes it from the table.
 */
class StreamTable {
public:
  uint64_t add(const std::string &path, std::shared_ptr<FileStream> stream);
  std::shared_ptr<FileStream> find(uint64_t fh) const;
  /// An open write stream for @p path, or nullptr. Read streams are skipped.
  std::shared_ptr<FileStream> findWriterByPath(const std::string &path) const;
  /// Detach the stream from the table without closing it.
  std::shared_ptr<FileStream> remove(uint64_t fh);
  /// Detach every stream; used on unmount.
  std::map<uint64_t, std::shared_ptr<FileStream>> drain();
  size_t size() const;

private:
  struct Entry {
    std::string path;
    std::shared_ptr<FileStream> stream;
  };

  mutable std::mutex mutex_;
  std::map<uint64_t, Entry> entries_;
  uint64_t nextHandle_{1};
};

} // namespace appendfs

#endif // APPENDFS_STREAM_TABLE_H
