#pragma once
#ifndef APPENDFS_ERRORS_H
#define APPENDFS_ERRORS_H

#include <stdexcept>
#include <string>

namespace appendfs {

/// Failure classes surfaced by streams, the factory and backend clients.
enum class StreamErrorCode {
  InvalidArgument,
  AlreadyExists,
  UnsupportedOperation,
  Unimplemented,
  RuntimeIO,
  WriteConflict,
  NotFound
};

/**
 * @brief Exception carrying a StreamErrorCode.
 *
 * The FUSE layer catches it and returns `-toErrno(code())`.
 */
class StreamException : public std::runtime_error {
public:
  StreamException(StreamErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  StreamErrorCode code() const noexcept { return code_; }

private:
  StreamErrorCode code_;
};

const char *errorCodeName(StreamErrorCode code);

/// Map an error class to the errno reported to the kernel (positive value).
int toErrno(StreamErrorCode code);

/// errno for any exception: StreamException by its code, anything else EIO.
int errnoForException(const std::exception &e);

/**
 * @brief Log the failure at ERROR level, then throw StreamException.
 *
 * Logging failures are reported on stderr and never mask the original error.
 */
[[noreturn]] void throwStreamError(StreamErrorCode code,
                                   const std::string &message);

/**
 * @brief Run a backend call, re-throwing any non-StreamException failure as
 * RuntimeIO prefixed with @p what.
 */
template <typename Fn>
auto wrapBackendCall(const std::string &what, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const StreamException &) {
    throw;
  } catch (const std::exception &e) {
    throwStreamError(StreamErrorCode::RuntimeIO, what + ": " + e.what());
  }
}

} // namespace appendfs

#endif // APPENDFS_ERRORS_H
