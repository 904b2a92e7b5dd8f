#include "gitdock/protocol.hpp"

#include "gitdock/consts.hpp"
#include "gitdock/graph.hpp"
#include "gitdock/log.hpp"
#include "gitdock/pack.hpp"
#include "gitdock/refs.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace gitdock {

namespace {

constexpr std::string_view kWantPrefix = "want ";
constexpr std::string_view kHavePrefix = "have ";
constexpr std::string_view kDone = "done";
constexpr std::string_view kReady = "ready";
constexpr std::string_view kNotFoundText = "repository not found or access denied";

oid expect_oid(std::string_view hex, std::string_view what) {
  auto id = parse_oid(hex);
  if (!id) {
    throw Error(Errc::Protocol, "malformed object id in " + std::string(what));
  }
  return *id;
}

RefUpdateCommand parse_update(std::string_view line) {
  // <old-hex> SP <new-hex> SP <refname>
  if (line.size() < 2 * consts::kOidHexLen + 3 || line[consts::kOidHexLen] != ' ' ||
      line[2 * consts::kOidHexLen + 1] != ' ') {
    throw Error(Errc::Protocol, "malformed ref update '" + std::string(line) + "'");
  }
  RefUpdateCommand u;
  u.old_value = expect_oid(line.substr(0, consts::kOidHexLen), "ref update");
  u.new_value = expect_oid(line.substr(consts::kOidHexLen + 1, consts::kOidHexLen), "ref update");
  u.ref = std::string(line.substr(2 * consts::kOidHexLen + 2));
  if (!valid_ref_name(u.ref)) {
    throw Error(Errc::Protocol, "invalid ref name '" + u.ref + "'");
  }
  return u;
}

} // namespace

std::string_view state_name(EngineState state) {
  switch (state) {
  case EngineState::AwaitCommand:
    return "await-command";
  case EngineState::AdvertiseRefs:
    return "advertise-refs";
  case EngineState::Negotiating:
    return "negotiating";
  case EngineState::Transferring:
    return "transferring";
  case EngineState::Finalizing:
    return "finalizing";
  case EngineState::Closed:
    return "closed";
  }
  return "unknown";
}

ChannelCommand parse_channel_command(std::string_view line) {
  const auto sp = line.find(' ');
  if (sp == std::string_view::npos) {
    throw Error(Errc::Protocol, "expected '<service> <path>'");
  }
  const std::string_view service = line.substr(0, sp);
  std::string_view path = line.substr(sp + 1);
  if (path.size() >= 2 && path.front() == '\'' && path.back() == '\'') {
    path = path.substr(1, path.size() - 2);
  }

  ChannelCommand cmd;
  if (service == consts::kUploadPack) {
    cmd.op = Operation::Fetch;
  } else if (service == consts::kReceivePack) {
    cmd.op = Operation::Push;
  } else if (service == consts::kUploadArchive) {
    throw Error(Errc::Protocol, "git-upload-archive is not supported");
  } else {
    throw Error(Errc::Protocol, "unknown service '" + std::string(service) + "'");
  }
  cmd.path = std::string(path);
  return cmd;
}

std::string format_channel_command(Operation op, std::string_view path) {
  const auto service = op == Operation::Fetch ? consts::kUploadPack : consts::kReceivePack;
  return std::string(service) + " '" + std::string(path) + "'";
}

std::string_view ref_status_name(RefStatus status) {
  switch (status) {
  case RefStatus::Ok:
    return "ok";
  case RefStatus::Conflict:
    return "conflict";
  case RefStatus::Rejected:
    return "rejected";
  }
  return "unknown";
}

std::optional<RefStatus> parse_ref_status(std::string_view name) {
  for (const auto s : {RefStatus::Ok, RefStatus::Conflict, RefStatus::Rejected}) {
    if (ref_status_name(s) == name) {
      return s;
    }
  }
  return std::nullopt;
}

Engine::Engine(const EngineContext &ctx, Identity who, ByteStream &io, std::string label)
    : ctx_(ctx), who_(std::move(who)), io_(io), label_(std::move(label)), in_(io), out_(io) {}

void Engine::run() {
  try {
    while (state_ != EngineState::Closed) {
      const EngineState at = state_;
      state_ = step(at);
      log::debug(label_ + ": " + std::string(state_name(at)) + " -> " +
                 std::string(state_name(state_)));
    }
  } catch (const Error &e) {
    failure_ = e.code();
    const std::string where = std::string(state_name(state_));
    state_ = EngineState::Closed;
    if (e.code() == Errc::Cancelled) {
      log::info(label_ + ": cancelled in " + where + ": " + e.what());
    } else {
      report(error_report(e), std::string(errc_name(e.code())) + " in " + where + ": " + e.what());
    }
  } catch (const std::exception &e) {
    failure_ = Errc::Protocol;
    state_ = EngineState::Closed;
    log::error(label_ + ": " + e.what());
    report("internal error", e.what());
  }
  // Anything still staged was never validated.
  quarantine_.reset();
}

void Engine::report(const std::string &what, const std::string &message) {
  log::warn(label_ + ": " + message);
  try {
    out_.error(what);
  } catch (const std::exception &e) {
    log::debug(label_ + ": error report not delivered: " + e.what());
  }
}

EngineState Engine::step(EngineState state) {
  switch (state) {
  case EngineState::AwaitCommand:
    return await_command();
  case EngineState::AdvertiseRefs:
    return advertise_refs();
  case EngineState::Negotiating:
    return op_ == Operation::Fetch ? negotiate_fetch() : negotiate_push();
  case EngineState::Transferring:
    return op_ == Operation::Fetch ? transfer_fetch() : transfer_push();
  case EngineState::Finalizing:
    return op_ == Operation::Fetch ? EngineState::Closed : finalize_push();
  case EngineState::Closed:
    break;
  }
  return EngineState::Closed;
}

std::optional<std::string> Engine::next_line() {
  auto pkt = in_.read();
  if (pkt && !pkt->empty() && pkt->back() == consts::kLF) {
    pkt->pop_back();
  }
  return pkt;
}

EngineState Engine::await_command() {
  const ChannelCommand cmd = parse_channel_command(in_.read_line());
  op_ = cmd.op;
  const std::string name = ctx_.resolver.normalize(cmd.path);
  log::info(label_ + ": " + who_.name + " " + (op_ == Operation::Fetch ? "fetch " : "push ") +
            name);

  const Capability cap = ctx_.auth.capability(who_, name);
  if (cap == Capability::None) {
    throw Error(Errc::NotFound, std::string(kNotFoundText));
  }
  if (op_ == Operation::Push && cap != Capability::ReadWrite) {
    throw Error(Errc::Forbidden, "push to " + name + " requires read-write access");
  }
  target_ = ctx_.resolver.resolve(cmd.path, cap, op_ == Operation::Push);
  repo_ = std::make_unique<Repository>(target_.path);
  return EngineState::AdvertiseRefs;
}

EngineState Engine::advertise_refs() {
  for (const auto &[name, id] : repo_->refs().list()) {
    out_.write_line(to_hex(id) + " " + name);
  }
  out_.flush();
  return EngineState::Negotiating;
}

EngineState Engine::negotiate_fetch() {
  OidSet seen;
  while (auto line = next_line()) {
    if (!line->starts_with(kWantPrefix)) {
      throw Error(Errc::Protocol, "expected 'want', got '" + *line + "'");
    }
    const oid id = expect_oid(std::string_view(*line).substr(kWantPrefix.size()), "want");
    if (seen.insert(id).second) {
      wants_.push_back(id);
    }
  }
  if (wants_.empty()) {
    return EngineState::Closed;
  }
  const ObjectStore &store = repo_->objects();
  for (const auto &w : wants_) {
    if (!store.contains(w)) {
      throw Error(Errc::ObjectMissing, "want " + to_hex(w) + " not found");
    }
  }

  std::size_t rounds = 0;
  for (;;) {
    std::vector<oid> common;
    bool done = false;
    while (auto line = next_line()) {
      if (*line == kDone) {
        done = true;
        break;
      }
      if (!line->starts_with(kHavePrefix)) {
        throw Error(Errc::Protocol, "expected 'have' or 'done', got '" + *line + "'");
      }
      const oid id = expect_oid(std::string_view(*line).substr(kHavePrefix.size()), "have");
      if (store.contains(id)) {
        haves_.push_back(id);
        common.push_back(id);
      }
    }
    if (done) {
      break;
    }
    ++rounds;
    for (const auto &id : common) {
      out_.write_line("ACK " + to_hex(id));
    }
    if (common.empty()) {
      out_.write_line("NAK");
    }
    if (rounds >= ctx_.round_limit) {
      log::info(label_ + ": round limit reached, sending pack");
      out_.write_line(kReady);
      out_.flush();
      break;
    }
    out_.flush();
  }
  return EngineState::Transferring;
}

EngineState Engine::transfer_fetch() {
  const ObjectStore &store = repo_->objects();
  const auto ids = objects_to_send(store, wants_, haves_);
  PktDataWriter data(out_);
  PackWriter pack([&](std::span<const std::uint8_t> bytes) { data.write(bytes); },
                  static_cast<std::uint32_t>(ids.size()));
  for (const auto &id : ids) {
    pack.add(store.get(id));
  }
  pack.finish();
  data.finish();
  objects_sent_ = ids.size();
  log::info(label_ + ": sent " + std::to_string(ids.size()) + " objects");
  return EngineState::Finalizing;
}

EngineState Engine::negotiate_push() {
  std::set<std::string> refs;
  while (auto line = next_line()) {
    auto u = parse_update(*line);
    if (!refs.insert(u.ref).second) {
      throw Error(Errc::Protocol, "duplicate update for " + u.ref);
    }
    updates_.push_back(std::move(u));
  }
  if (updates_.empty()) {
    out_.flush(); // empty report
    return EngineState::Closed;
  }
  return EngineState::Transferring;
}

EngineState Engine::transfer_push() {
  const bool needs_pack = std::ranges::any_of(
      updates_, [](const RefUpdateCommand &u) { return !is_null(u.new_value); });
  if (needs_pack) {
    quarantine_ = std::make_unique<Quarantine>(repo_->objects());
    PktDataReader data(in_);
    PackReader pack([&](std::uint8_t *dst, std::size_t n) { data.read_exact(dst, n); });
    std::vector<oid> incoming;
    incoming.reserve(pack.count());
    while (auto obj = pack.next()) {
      incoming.push_back(quarantine_->put(obj->type, obj->data));
    }
    data.expect_end();
    objects_received_ = incoming.size();
    if (auto missing = find_missing_reference(*quarantine_, incoming)) {
      throw Error(Errc::IncompleteTransfer, "missing object " + to_hex(*missing));
    }
  }
  const ObjectReader &view =
      quarantine_ ? static_cast<const ObjectReader &>(*quarantine_) : repo_->objects();
  for (const auto &u : updates_) {
    if (!is_null(u.new_value) && !view.contains(u.new_value)) {
      throw Error(Errc::IncompleteTransfer,
                  u.ref + " points at missing object " + to_hex(u.new_value));
    }
  }
  return EngineState::Finalizing;
}

EngineState Engine::finalize_push() {
  if (quarantine_) {
    quarantine_->promote();
    quarantine_.reset();
  }
  out_.write_line("unpack ok");
  for (const auto &u : updates_) {
    const RefStatus status = apply_update(u);
    results_.push_back(RefResult{u.ref, status});
    if (status == RefStatus::Ok) {
      out_.write_line("ok " + u.ref);
    } else {
      out_.write_line("ng " + u.ref + " " + std::string(ref_status_name(status)));
    }
    log::info(label_ + ": " + u.ref + " " + std::string(ref_status_name(status)));
  }
  out_.flush();
  return EngineState::Closed;
}

RefStatus Engine::apply_update(const RefUpdateCommand &u) {
  if (!ctx_.policy.allows(who_, target_.name, u.ref)) {
    return RefStatus::Rejected;
  }
  RefUpdate outcome = RefUpdate::Conflict;
  try {
    outcome = repo_->update_ref(u.ref, u.old_value, u.new_value);
  } catch (const std::runtime_error &e) {
    // e.g. "refs/heads/main/sub" while "refs/heads/main" is a file
    log::warn(label_ + ": cannot store " + u.ref + ": " + e.what());
    return RefStatus::Rejected;
  }
  if (outcome != RefUpdate::Ok) {
    return RefStatus::Conflict;
  }
  // Per update: a later failure in this push must not leave stale views.
  ctx_.cache.invalidate(target_.name);
  return RefStatus::Ok;
}

} // namespace gitdock
