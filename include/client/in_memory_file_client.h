#pragma once
#ifndef APPENDFS_IN_MEMORY_FILE_CLIENT_H
#define APPENDFS_IN_MEMORY_FILE_CLIENT_H

#include "client/remote_file_client.h"

#include <condition_variable>
#include <mutex>
#include <unordered_map>

namespace appendfs {

/**
 * @brief RemoteFileClient keeping every file in process memory.
 *
 * Output handles buffer appended bytes and publish them on flush() and
 * close(); close() also marks the file completed and stamps its SHA-256
 * digest. Completion wakes threads blocked in waitForCompletion().
 *
 * The test hooks (putFile, markIncomplete, markComplete, setFailure) let
 * callers simulate other writers and backend failures.
 */
class InMemoryFileClient : public RemoteFileClient {
public:
  /// Operations that setFailure() can make throw RuntimeIO.
  enum class FailurePoint { Create, Delete, Write, Flush, Close };

  InMemoryFileClient();
  ~InMemoryFileClient() override;

  std::optional<FileInfo> getStatus(const std::string &path) override;
  std::optional<FileInfo>
  waitForCompletion(const std::string &path, std::chrono::milliseconds timeout,
                    std::chrono::milliseconds pollInterval,
                    const std::atomic<bool> *cancel) override;
  std::unique_ptr<OutputHandle>
  createFile(const std::string &path, const CreateOptions &options) override;
  void deleteFile(const std::string &path) override;
  std::vector<char> readFile(const std::string &path, uint64_t offset,
                             size_t size) override;
  std::vector<FileInfo> listFiles() override;

  /// Insert a file with the given content, completed unless told otherwise.
  void putFile(const std::string &path, const std::string &content,
               uint32_t mode = 0100644, bool completed = true);
  void markIncomplete(const std::string &path);
  void markComplete(const std::string &path);
  void setFailure(FailurePoint point, bool enabled);

  /// Options the file was created with, if it was created via createFile().
  std::optional<WriteOptions> writeOptionsOf(const std::string &path) const;
  /// Whole persisted content; empty string if absent.
  std::string contentOf(const std::string &path) const;

  struct State;

private:
  std::shared_ptr<State> state_;
};

} // namespace appendfs

#endif // APPENDFS_IN_MEMORY_FILE_CLIENT_H
