#include "stream/stream_table.h"

namespace appendfs {

uint64_t StreamTable::add(const std::string &path,
                          std::shared_ptr<FileStream> stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t fh = nextHandle_++;
  entries_.emplace(fh, Entry{path, std::move(stream)});
  return fh;
}

std::shared_ptr<FileStream> StreamTable::find(uint64_t fh) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(fh);
  return it == entries_.end() ? nullptr : it->second.stream;
}

std::shared_ptr<FileStream>
StreamTable::findWriterByPath(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &kv : entries_) {
    if (kv.second.path == path && !kv.second.stream->isReadOnly()) {
      return kv.second.stream;
    }
  }
  return nullptr;
}

std::shared_ptr<FileStream> StreamTable::remove(uint64_t fh) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(fh);
  if (it == entries_.end()) {
    return nullptr;
  }
  auto stream = std::move(it->second.stream);
  entries_.erase(it);
  return stream;
}

std::map<uint64_t, std::shared_ptr<FileStream>> StreamTable::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<uint64_t, std::shared_ptr<FileStream>> out;
  for (auto &kv : entries_) {
    out.emplace(kv.first, std::move(kv.second.stream));
  }
  entries_.clear();
  return out;
}

size_t StreamTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace appendfs
