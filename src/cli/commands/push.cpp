#include "cli/registry.hpp"
#include "cli/endpoint.hpp"
#include "gitdock/client.hpp"
#include "gitdock/refs.hpp"
#include "gitdock/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int cmd_push(int argc, char **argv) {
  if (argc < 6) {
    return gitdock::cli::usage_error("push");
  }
  try {
    const auto ep = gitdock::cli::parse_endpoint(argv[1]);
    const auto key = gitdock::cli::load_key_arg(argv[3]);
    const gitdock::Repository local{std::filesystem::path{argv[4]}};
    if (!local.is_initialized()) {
      std::cerr << "push: not a gitdock repository: " << argv[4] << "\n";
      return gitdock::cli::kExitFailure;
    }

    std::vector<gitdock::PushSpec> specs;
    for (int i = 5; i < argc; ++i) {
      std::string ref = argv[i];
      gitdock::PushSpec spec;
      if (ref.starts_with(':')) {
        spec.ref = ref.substr(1); // delete
      } else {
        if (!ref.starts_with("refs/")) {
          ref = gitdock::heads_ref(ref);
        }
        spec.ref = ref;
        spec.new_value = local.resolve_ref(ref);
      }
      specs.push_back(std::move(spec));
    }

    auto client = gitdock::Client::connect(ep.host, ep.port, key ? &*key : nullptr);
    const auto result = client.push(argv[2], local, specs);
    std::cout << "sent " << result.objects_sent << " objects\n";
    for (const auto &r : result.refs) {
      std::cout << " " << gitdock::ref_status_name(r.status) << " " << r.ref << "\n";
    }
    return result.all_ok() ? gitdock::cli::kExitOk : gitdock::cli::kExitConflict;
  } catch (const std::exception &e) {
    return gitdock::cli::report_failure("push", e);
  }
}
