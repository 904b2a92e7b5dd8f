#pragma once
#include "cli/command.hpp"

#include <exception>
#include <ostream>
#include <string>

namespace gitdock::cli {

// Exit statuses shared by every command.
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitDenied = 3;   // unauthenticated or forbidden
inline constexpr int kExitNotFound = 4; // repository, ref or object
inline constexpr int kExitConflict = 5; // a ref moved underneath us

struct CommandInfo {
  command_fn fn;
  std::string args;    // e.g. "<host:port> <repo> <key|->"
  std::string summary;
};

void register_command(const std::string &name, command_fn fn, const std::string &args,
                      const std::string &summary);
const CommandInfo *find_command(const std::string &name);
void print_usage(std::ostream &out);

// "usage: gitdock <name> <args>" on stderr; returns kExitUsage.
int usage_error(const std::string &name);

// One line on stderr naming the command and, for gitdock::Error, its code.
// Returns the exit status for the failure.
int report_failure(const std::string &name, const std::exception &e);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitdock::cli
