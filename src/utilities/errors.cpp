#include "utilities/errors.h"
#include "utilities/logger.h"

#include <cerrno>
#include <iostream>

namespace appendfs {

const char *errorCodeName(StreamErrorCode code) {
  switch (code) {
  case StreamErrorCode::InvalidArgument:
    return "InvalidArgument";
  case StreamErrorCode::AlreadyExists:
    return "AlreadyExists";
  case StreamErrorCode::UnsupportedOperation:
    return "UnsupportedOperation";
  case StreamErrorCode::Unimplemented:
    return "Unimplemented";
  case StreamErrorCode::RuntimeIO:
    return "RuntimeIO";
  case StreamErrorCode::WriteConflict:
    return "WriteConflict";
  case StreamErrorCode::NotFound:
    return "NotFound";
  }
  return "Unknown";
}

int toErrno(StreamErrorCode code) {
  switch (code) {
  case StreamErrorCode::InvalidArgument:
    return EINVAL;
  case StreamErrorCode::AlreadyExists:
    return EEXIST;
  case StreamErrorCode::UnsupportedOperation:
    return EBADF;
  case StreamErrorCode::Unimplemented:
    return EOPNOTSUPP;
  case StreamErrorCode::RuntimeIO:
    return EIO;
  case StreamErrorCode::WriteConflict:
    return EBUSY;
  case StreamErrorCode::NotFound:
    return ENOENT;
  }
  return EIO;
}

int errnoForException(const std::exception &e) {
  if (auto *se = dynamic_cast<const StreamException *>(&e)) {
    return toErrno(se->code());
  }
  return EIO;
}

void throwStreamError(StreamErrorCode code, const std::string &message) {
  std::string msg =
      std::string(errorCodeName(code)) + ". Message: " + message;
  try {
    Logger::getInstance().log(LogLevel::ERROR, msg);
  } catch (const std::runtime_error &e) {
    std::cerr << "Logger not initialized. Original error: " << msg
              << " Logger error: " << e.what() << std::endl;
  }
  throw StreamException(code, message);
}

} // namespace appendfs
