#include "cli/registry.hpp"
#include "gitdock/fs.hpp"
#include "gitdock/keys.hpp"

#include <filesystem>
#include <iostream>

int cmd_keygen(int argc, char **argv) {
  if (argc < 2) {
    return gitdock::cli::usage_error("keygen");
  }
  try {
    const std::filesystem::path path = argv[1];
    if (gitdock::fs::exists(path)) {
      std::cerr << "keygen: " << path << " already exists\n";
      return gitdock::cli::kExitFailure;
    }
    const auto key = gitdock::PrivateKey::generate();
    key.save(path);
    auto pub = key.public_key();
    pub.comment = path.filename().string();
    const std::string line = gitdock::format_openssh_public_key(pub);
    gitdock::fs::write_file_atomic(path.string() + ".pub", line + "\n");
    std::cout << line << "\n";
    return 0;
  } catch (const std::exception &e) {
    return gitdock::cli::report_failure("keygen", e);
  }
}
