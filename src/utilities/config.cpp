#include "utilities/config.h"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace appendfs {

namespace {

void loadWriteOptions(const YAML::Node &node, WriteOptions &opts) {
  if (node["block_size_bytes"])
    opts.blockSizeBytes = node["block_size_bytes"].as<uint64_t>();
  if (node["storage_tier"])
    opts.storageTier = node["storage_tier"].as<std::string>();
  if (node["ttl_ms"])
    opts.ttlMs = node["ttl_ms"].as<int64_t>();
  if (node["location_policy"])
    opts.locationPolicy = node["location_policy"].as<std::string>();
  if (node["location_policy_options"]) {
    opts.locationPolicyOptions =
        node["location_policy_options"]
            .as<std::map<std::string, std::string>>();
  }
  if (node["hostname"])
    opts.hostname = node["hostname"].as<std::string>();
}

std::chrono::milliseconds parseMillis(const char *value, const char *name) {
  try {
    long long ms = std::stoll(value);
    if (ms < 0) {
      throw std::out_of_range("negative");
    }
    return std::chrono::milliseconds(ms);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Invalid value for ") + name + ": " +
                             value + " (" + e.what() + ")");
  }
}

} // namespace

MountOptions loadMountOptions(const std::string &path) {
  MountOptions opts;
  if (!std::filesystem::exists(path)) {
    return opts;
  }
  try {
    YAML::Node node = YAML::LoadFile(path);
    if (node["log_file"])
      opts.logFile = node["log_file"].as<std::string>();
    if (node["log_level"])
      opts.logLevel = Logger::levelFromString(node["log_level"].as<std::string>());
    if (node["default_file_mode"]) {
      // Always read as octal, "644" and "0644" are the same mode.
      opts.defaultFileMode = static_cast<uint32_t>(
          std::stoul(node["default_file_mode"].as<std::string>(), nullptr, 8));
    }
    if (node["completion_wait_timeout_ms"])
      opts.completionWaitTimeout = std::chrono::milliseconds(
          node["completion_wait_timeout_ms"].as<long long>());
    if (node["completion_poll_interval_ms"])
      opts.completionPollInterval = std::chrono::milliseconds(
          node["completion_poll_interval_ms"].as<long long>());
    if (node["lock_timeout_ms"])
      opts.lockTimeout =
          std::chrono::milliseconds(node["lock_timeout_ms"].as<long long>());
    if (node["zero_fill_chunk_bytes"])
      opts.zeroFillChunkBytes = node["zero_fill_chunk_bytes"].as<size_t>();
    if (node["auth_policy"])
      opts.authPolicy = node["auth_policy"].as<std::string>();
    if (node["custom_uid"])
      opts.customUid = node["custom_uid"].as<uint32_t>();
    if (node["custom_gid"])
      opts.customGid = node["custom_gid"].as<uint32_t>();
    if (node["write_options"])
      loadWriteOptions(node["write_options"], opts.writeOptions);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config " + path + ": " + e.what());
  } catch (const std::logic_error &e) {
    // std::stoul and Logger::levelFromString failures.
    throw std::runtime_error("Invalid value in config " + path + ": " +
                             e.what());
  }
  if (opts.zeroFillChunkBytes == 0) {
    throw std::runtime_error("zero_fill_chunk_bytes must be positive in " +
                             path);
  }
  if (opts.authPolicy != "system" && opts.authPolicy != "custom") {
    throw std::runtime_error("Unknown auth_policy '" + opts.authPolicy +
                             "' in " + path);
  }
  return opts;
}

void applyEnvironmentOverrides(MountOptions &opts) {
  if (const char *env = std::getenv("APPENDFS_LOG_LEVEL")) {
    try {
      opts.logLevel = Logger::levelFromString(env);
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(std::string("APPENDFS_LOG_LEVEL: ") + e.what());
    }
  }
  if (const char *env = std::getenv("APPENDFS_LOG_FILE")) {
    opts.logFile = env;
  }
  if (const char *env = std::getenv("APPENDFS_COMPLETION_WAIT_MS")) {
    opts.completionWaitTimeout =
        parseMillis(env, "APPENDFS_COMPLETION_WAIT_MS");
  }
}

std::string defaultConfigPath() {
  const char *cfg = std::getenv("APPENDFS_CONFIG");
  if (cfg && cfg[0] != '\0') {
    return cfg;
  }
  return "appendfs_config.yaml";
}

} // namespace appendfs
