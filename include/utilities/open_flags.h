#pragma once
#ifndef APPENDFS_OPEN_FLAGS_H
#define APPENDFS_OPEN_FLAGS_H

#include <fcntl.h>

namespace appendfs {

inline bool isReadOnlyOpen(int flags) { return (flags & O_ACCMODE) == O_RDONLY; }
inline bool containsTruncate(int flags) { return (flags & O_TRUNC) != 0; }

} // namespace appendfs

#endif // APPENDFS_OPEN_FLAGS_H
