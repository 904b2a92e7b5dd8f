#include "cli/registry.hpp"
#include "gitdock/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int argc, char **argv) {
  if (argc < 2) {
    return gitdock::cli::usage_error("init");
  }
  try {
    const std::filesystem::path root = argv[1];
    const gitdock::Repository repo{root};
    repo.init();
    std::cout << "Initialized empty gitdock repository in " << root << "\n";
    return 0;
  } catch (const std::exception &e) {
    return gitdock::cli::report_failure("init", e);
  }
}
