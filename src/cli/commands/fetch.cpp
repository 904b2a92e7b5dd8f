#include "cli/registry.hpp"
#include "cli/endpoint.hpp"
#include "gitdock/client.hpp"
#include "gitdock/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_fetch(int argc, char **argv) {
  if (argc < 5) {
    return gitdock::cli::usage_error("fetch");
  }
  try {
    const auto ep = gitdock::cli::parse_endpoint(argv[1]);
    const auto key = gitdock::cli::load_key_arg(argv[3]);
    gitdock::Repository local{std::filesystem::path{argv[4]}};
    if (!local.is_initialized()) {
      local.init();
    }
    auto client = gitdock::Client::connect(ep.host, ep.port, key ? &*key : nullptr);
    const auto result = client.fetch(argv[2], local);
    std::cout << "received " << result.objects_received << " objects\n";
    for (const auto &ref : result.updated) {
      std::cout << " " << gitdock::to_hex(result.refs.at(ref)) << " " << ref << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return gitdock::cli::report_failure("fetch", e);
  }
}
