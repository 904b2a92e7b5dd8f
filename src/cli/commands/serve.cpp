#include "cli/registry.hpp"
#include "gitdock/config.hpp"
#include "gitdock/log.hpp"
#include "gitdock/server.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <thread>

int cmd_serve(int argc, char **argv) {
  if (argc < 2) {
    return gitdock::cli::usage_error("serve");
  }
  try {
    const auto config = gitdock::load_server_config(argv[1]);
    if (std::getenv("GITDOCK_LOG") == nullptr) {
      gitdock::Logger::instance().set_level(config.log_level);
    }

    // Block the stop signals before any thread exists so only the waiter
    // below receives them.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    gitdock::Server server(config);
    server.listen();
    std::cout << "gitdock serve listening on port " << server.port() << " (Ctrl+C to stop)\n";

    std::thread waiter([&] {
      int sig = 0;
      sigwait(&stop_signals, &sig);
      gitdock::log::info("signal " + std::to_string(sig) + ", shutting down");
      server.stop();
    });
    try {
      server.run();
    } catch (...) {
      // Release the waiter before unwinding past it.
      pthread_kill(waiter.native_handle(), SIGTERM);
      waiter.join();
      throw;
    }
    if (waiter.joinable()) {
      pthread_kill(waiter.native_handle(), SIGTERM);
      waiter.join();
    }
    return 0;
  } catch (const std::exception &e) {
    return gitdock::cli::report_failure("serve", e);
  }
}
