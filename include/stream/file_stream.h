#pragma once
#ifndef APPENDFS_FILE_STREAM_H
#define APPENDFS_FILE_STREAM_H

#include "stream/create_file_status.h"

#include <cstdint>
#include <span>

namespace appendfs {

/**
 * @brief Operations the FUSE layer routes to the stream of one open file
 * descriptor. Failures are thrown as StreamException.
 */
class FileStream {
public:
  virtual ~FileStream() = default;

  /// Read @p size bytes at @p offset into @p buf. Returns bytes read.
  virtual int64_t read(std::span<char> buf, int64_t size, int64_t offset) = 0;
  /// Write the first @p size bytes of @p buf at @p offset.
  virtual void write(std::span<const char> buf, int64_t size,
                     int64_t offset) = 0;
  virtual void truncate(int64_t size) = 0;
  virtual void flush() = 0;
  virtual CreateFileStatus getStatus() = 0;
  virtual void close() = 0;
  virtual bool isClosed() const = 0;
  virtual bool isReadOnly() const = 0;
};

} // namespace appendfs

#endif // APPENDFS_FILE_STREAM_H
