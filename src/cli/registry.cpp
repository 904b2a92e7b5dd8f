#include "cli/registry.hpp"

#include "gitdock/error.hpp"

#include <iostream>
#include <map>

namespace gitdock::cli {

static std::map<std::string, CommandInfo> &table() {
  static std::map<std::string, CommandInfo> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &args,
                      const std::string &summary) {
  table()[name] = CommandInfo{.fn = fn, .args = args, .summary = summary};
}

const CommandInfo *find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &out) {
  out << "usage: gitdock <command> [args]\n\n";
  out << "commands:\n";
  for (const auto &[name, info] : table()) {
    out << "  " << name << " " << info.args << "\n";
    out << "      " << info.summary << "\n";
  }
}

int usage_error(const std::string &name) {
  const auto *info = find_command(name);
  std::cerr << "usage: gitdock " << name << " " << (info ? info->args : std::string{}) << "\n";
  return kExitUsage;
}

int report_failure(const std::string &name, const std::exception &e) {
  const auto *err = dynamic_cast<const Error *>(&e);
  if (err == nullptr) {
    std::cerr << name << ": " << e.what() << "\n";
    return kExitFailure;
  }
  std::cerr << name << ": " << errc_name(err->code()) << ": " << err->what() << "\n";
  switch (err->code()) {
  case Errc::Unauthenticated:
  case Errc::Forbidden:
    return kExitDenied;
  case Errc::NotFound:
  case Errc::RefMissing:
  case Errc::ObjectMissing:
    return kExitNotFound;
  case Errc::Conflict:
    return kExitConflict;
  default:
    return kExitFailure;
  }
}

} // namespace gitdock::cli
