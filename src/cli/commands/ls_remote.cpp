#include "cli/registry.hpp"
#include "cli/endpoint.hpp"
#include "gitdock/client.hpp"

#include <iostream>

int cmd_ls_remote(int argc, char **argv) {
  if (argc < 4) {
    return gitdock::cli::usage_error("ls-remote");
  }
  try {
    const auto ep = gitdock::cli::parse_endpoint(argv[1]);
    const auto key = gitdock::cli::load_key_arg(argv[3]);
    auto client = gitdock::Client::connect(ep.host, ep.port, key ? &*key : nullptr);
    for (const auto &[name, id] : client.ls_remote(argv[2])) {
      std::cout << gitdock::to_hex(id) << "\t" << name << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return gitdock::cli::report_failure("ls-remote", e);
  }
}
