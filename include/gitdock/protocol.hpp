#pragma once
#include "gitdock/auth.hpp"
#include "gitdock/cache.hpp"
#include "gitdock/error.hpp"
#include "gitdock/hash.hpp"
#include "gitdock/object_store.hpp"
#include "gitdock/pktline.hpp"
#include "gitdock/repo.hpp"
#include "gitdock/resolver.hpp"
#include "gitdock/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitdock {

enum class EngineState : std::uint8_t {
  AwaitCommand,
  AdvertiseRefs,
  Negotiating,
  Transferring,
  Finalizing,
  Closed,
};

std::string_view state_name(EngineState state);

enum class Operation : std::uint8_t { Fetch, Push };

// "git-upload-pack '<path>'" / "git-receive-pack '<path>'"
struct ChannelCommand {
  Operation op;
  std::string path;
};

// Throws Error(Protocol) for anything else, including git-upload-archive.
ChannelCommand parse_channel_command(std::string_view line);
std::string format_channel_command(Operation op, std::string_view path);

// One "<old-hex> <new-hex> <refname>" line of a push. A null old value
// creates the ref, a null new value deletes it.
struct RefUpdateCommand {
  std::string ref;
  oid old_value{};
  oid new_value{};
};

enum class RefStatus : std::uint8_t { Ok, Conflict, Rejected };

std::string_view ref_status_name(RefStatus status);
std::optional<RefStatus> parse_ref_status(std::string_view name);

struct RefResult {
  std::string ref;
  RefStatus status;
};

// Process-wide services every engine works against. Owned by the server.
struct EngineContext {
  const Authenticator &auth;
  const RepositoryResolver &resolver;
  ViewCache &cache;
  const RefPolicy &policy;
  std::size_t round_limit;
};

/**
 * Serves one fetch or push on one channel. Each state is a member function
 * that consumes its input and returns the next state:
 *
 *   AwaitCommand -> AdvertiseRefs -> Negotiating -> Transferring
 *                -> Finalizing -> Closed
 *
 * Any state may jump to Closed (zero wants, zero updates). Errors are
 * reported to the peer as "ERR <code>: <message>" and end only this
 * channel.
 */
class Engine {
public:
  Engine(const EngineContext &ctx, Identity who, ByteStream &io, std::string label = "channel");

  // Drive the state machine to Closed. Does not throw; the outcome is
  // available through failure() and results().
  void run();

  [[nodiscard]] EngineState state() const { return state_; }
  [[nodiscard]] const std::optional<Errc> &failure() const { return failure_; }
  [[nodiscard]] const std::vector<RefResult> &results() const { return results_; }
  [[nodiscard]] std::size_t objects_sent() const { return objects_sent_; }
  [[nodiscard]] std::size_t objects_received() const { return objects_received_; }

private:
  EngineState step(EngineState state);

  EngineState await_command();
  EngineState advertise_refs();
  EngineState negotiate_fetch();
  EngineState negotiate_push();
  EngineState transfer_fetch();
  EngineState transfer_push();
  EngineState finalize_push();
  RefStatus apply_update(const RefUpdateCommand &u);

  // Next data packet without its trailing newline; nullopt on flush.
  std::optional<std::string> next_line();
  void report(const std::string &what, const std::string &message);

  const EngineContext &ctx_;
  Identity who_;
  ByteStream &io_;
  std::string label_;
  PktReader in_;
  PktWriter out_;

  EngineState state_{EngineState::AwaitCommand};
  Operation op_{Operation::Fetch};
  ResolvedRepository target_;
  std::unique_ptr<Repository> repo_;
  std::unique_ptr<Quarantine> quarantine_;

  std::vector<oid> wants_;
  std::vector<oid> haves_;
  std::vector<RefUpdateCommand> updates_;
  std::vector<RefResult> results_;
  std::size_t objects_sent_{0};
  std::size_t objects_received_{0};
  std::optional<Errc> failure_;
};

} // namespace gitdock
