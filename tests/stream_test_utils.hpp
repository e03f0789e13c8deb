#pragma once
#ifndef TESTS_STREAM_TEST_UTILS_HPP
#define TESTS_STREAM_TEST_UTILS_HPP

#include "client/in_memory_file_client.h"
#include "lock/path_lock_manager.h"
#include "stream/auth_policy.h"
#include "stream/stream_factory.h"
#include "utilities/config.h"
#include "utilities/errors.h"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <memory>
#include <span>
#include <string>

/// Options with short waits so timeout paths finish quickly.
inline appendfs::MountOptions testMountOptions() {
  appendfs::MountOptions opts;
  opts.completionWaitTimeout = std::chrono::milliseconds(50);
  opts.completionPollInterval = std::chrono::milliseconds(5);
  opts.authPolicy = "custom";
  opts.customUid = 1000;
  opts.customGid = 1000;
  opts.writeOptions.blockSizeBytes = 1024;
  opts.writeOptions.storageTier = "SSD";
  opts.writeOptions.ttlMs = 60000;
  opts.writeOptions.locationPolicy = "round_robin";
  opts.writeOptions.locationPolicyOptions = {{"replicas", "2"}};
  opts.writeOptions.hostname = "worker-1";
  return opts;
}

inline std::span<const char> bytesOf(const std::string &s) {
  return std::span<const char>(s.data(), s.size());
}

/// Runs @p fn and returns the StreamErrorCode it threw; fails if none.
template <typename Fn> appendfs::StreamErrorCode errorCodeOf(Fn &&fn) {
  try {
    fn();
  } catch (const appendfs::StreamException &e) {
    return e.code();
  }
  ADD_FAILURE() << "expected a StreamException";
  return appendfs::StreamErrorCode::RuntimeIO;
}

/**
 * @brief Fixture wiring an in-memory backend, a lock manager and a factory.
 */
class StreamTestBase : public ::testing::Test {
protected:
  explicit StreamTestBase(appendfs::MountOptions opts = testMountOptions())
      : options_(std::move(opts)),
        auth_(options_.customUid, options_.customGid),
        factory_(std::make_unique<appendfs::StreamFactory>(client_, locks_,
                                                           auth_, options_)) {}

  void rebuildFactory(const appendfs::MountOptions &opts) {
    options_ = opts;
    factory_ = std::make_unique<appendfs::StreamFactory>(client_, locks_,
                                                         auth_, options_);
  }

  std::unique_ptr<appendfs::SequentialWriteStream>
  openNew(const std::string &path, int flags = O_WRONLY | O_CREAT) {
    return factory_->open(path, flags);
  }

  appendfs::InMemoryFileClient client_;
  appendfs::PathLockManager locks_;
  appendfs::MountOptions options_;
  appendfs::CustomAuthPolicy auth_;
  std::unique_ptr<appendfs::StreamFactory> factory_;
};

#endif // TESTS_STREAM_TEST_UTILS_HPP
