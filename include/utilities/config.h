#pragma once
#ifndef APPENDFS_CONFIG_H
#define APPENDFS_CONFIG_H

#include "client/remote_file_client.h"
#include "utilities/logger.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace appendfs {

/// Settings of one mount. Defaults apply to every key the file omits.
struct MountOptions {
  std::string logFile{Logger::CONSOLE_ONLY_OUTPUT};
  LogLevel logLevel{LogLevel::INFO};

  /// Permission bits for new files when the caller gives none.
  uint32_t defaultFileMode{0644};
  /// Bound on waiting for another writer to complete a file.
  std::chrono::milliseconds completionWaitTimeout{5000};
  std::chrono::milliseconds completionPollInterval{10};
  /// How long open() waits for a conflicting path lock; 0 fails at once.
  std::chrono::milliseconds lockTimeout{0};
  /// Largest single write used when padding a virtually extended file.
  size_t zeroFillChunkBytes{4 * 1024 * 1024};

  /// "system" (owner of the calling process) or "custom".
  std::string authPolicy{"system"};
  uint32_t customUid{0};
  uint32_t customGid{0};

  WriteOptions writeOptions;
};

/**
 * @brief Load options from a YAML file.
 *
 * A missing file yields the defaults. A file that exists but does not parse,
 * or holds a value of the wrong type, throws std::runtime_error.
 */
MountOptions loadMountOptions(const std::string &path);

/**
 * @brief Apply APPENDFS_LOG_LEVEL, APPENDFS_LOG_FILE and
 * APPENDFS_COMPLETION_WAIT_MS on top of @p opts.
 */
void applyEnvironmentOverrides(MountOptions &opts);

/// Config path from APPENDFS_CONFIG, else "appendfs_config.yaml".
std::string defaultConfigPath();

} // namespace appendfs

#endif // APPENDFS_CONFIG_H
