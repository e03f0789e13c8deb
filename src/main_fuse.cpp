#include "client/in_memory_file_client.h"
#include "utilities/config.h"
#include "utilities/fuse_adapter.h"
#include "utilities/logger.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// Usage: appendfs_fuse [--config FILE] <mountpoint> [FUSE options]
int main(int argc, char *argv[]) {
  std::string configPath = appendfs::defaultConfigPath();
  std::vector<char *> fuseArgv;
  fuseArgv.push_back(argv[0]);
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "--config requires a file argument" << std::endl;
        return 1;
      }
      configPath = argv[++i];
      continue;
    }
    fuseArgv.push_back(argv[i]);
  }
  if (fuseArgv.size() < 2) {
    std::cerr << "Usage: " << argv[0]
              << " [--config FILE] <mountpoint> [FUSE options]" << std::endl;
    return 1;
  }

  appendfs::MountOptions options;
  try {
    options = appendfs::loadMountOptions(configPath);
    appendfs::applyEnvironmentOverrides(options);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  Logger::init(options.logFile, options.logLevel);
  Logger::getInstance().log(LogLevel::INFO,
                            "[FUSE_ADAPTER] Starting AppendFS on " +
                                std::string(fuseArgv[1]) + " (config " +
                                configPath + ")");

  int fuse_ret = 1;
  try {
    // The remote transport is supplied by the deployment; this binary
    // mounts the in-process store.
    appendfs::InMemoryFileClient client;
    AppendFsFuseData fuse_data(client, options);
    struct fuse_operations ops = appendfs_operations();
    struct fuse_args args =
        FUSE_ARGS_INIT(static_cast<int>(fuseArgv.size()), fuseArgv.data());
    fuse_ret = fuse_main(args.argc, args.argv, &ops, &fuse_data);
    fuse_opt_free_args(&args);
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::FATAL,
                              std::string("[FUSE_ADAPTER] ") + e.what());
    return 1;
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "[FUSE_ADAPTER] fuse_main returned " +
                                std::to_string(fuse_ret));
  return fuse_ret;
}
