#include "cli/registry.hpp"

int cmd_serve(int, char **);
int cmd_init(int, char **);
int cmd_keygen(int, char **);
int cmd_ls_remote(int, char **);
int cmd_fetch(int, char **);
int cmd_push(int, char **);

namespace gitdock::cli {

void register_all_commands() {
  register_command("serve", ::cmd_serve, "<config>", "Run the hosting daemon");
  register_command("init", ::cmd_init, "<dir>", "Create an empty bare repository");
  register_command("keygen", ::cmd_keygen, "<file>",
                   "Generate an ed25519 key pair (writes <file> and <file>.pub)");
  register_command("ls-remote", ::cmd_ls_remote, "<host:port> <repo> <key|->",
                   "List remote refs ('-' connects as guest)");
  register_command("fetch", ::cmd_fetch, "<host:port> <repo> <key|-> <dir>",
                   "Download missing objects and mirror the remote refs into <dir>");
  register_command("push", ::cmd_push, "<host:port> <repo> <key> <dir> <ref>...",
                   "Update remote refs from <dir>; ':<ref>' deletes");
}

} // namespace gitdock::cli
