#include "gitdock/client.hpp"

#include "gitdock/error.hpp"
#include "gitdock/graph.hpp"
#include "gitdock/log.hpp"
#include "gitdock/pack.hpp"
#include "gitdock/pktline.hpp"
#include "gitdock/session.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace gitdock {

namespace {

RefTable read_advertisement(PktReader &in) {
  RefTable refs;
  while (auto line = in.read_checked()) {
    const auto sp = line->find(' ');
    std::optional<oid> id;
    if (sp != std::string::npos) {
      id = parse_oid(std::string_view(*line).substr(0, sp));
    }
    if (!id) {
      throw Error(Errc::Protocol, "malformed ref advertisement '" + *line + "'");
    }
    refs.emplace(line->substr(sp + 1), *id);
  }
  return refs;
}

// Open a channel and send the service command; the server answers with its
// ref advertisement.
std::shared_ptr<Channel> start_channel(Connection &conn, Operation op,
                                       std::string_view repository) {
  auto ch = conn.open_channel();
  PktWriter(*ch).write_line(format_channel_command(op, repository));
  return ch;
}

// Closes the channel on every exit path, so a failed call does not leave it
// registered with the connection.
class ChannelCloser {
public:
  explicit ChannelCloser(std::shared_ptr<Channel> ch) : ch_(std::move(ch)) {}
  ~ChannelCloser() { ch_->close(); }
  ChannelCloser(const ChannelCloser &) = delete;
  ChannelCloser &operator=(const ChannelCloser &) = delete;

private:
  std::shared_ptr<Channel> ch_;
};

std::vector<std::string> mirror_refs(Repository &local, const RefTable &remote) {
  std::vector<std::string> updated;
  for (const auto &[name, id] : remote) {
    const auto current = local.refs().find(name);
    if (current == id) {
      continue;
    }
    if (local.update_ref(name, current.value_or(kNullOid), id) == RefUpdate::Ok) {
      updated.push_back(name);
    } else {
      log::warn("fetch: local " + name + " changed concurrently, left as is");
    }
  }
  return updated;
}

// Local ref tips, most recently committed first: the server may stop
// listening after a few rounds, and recent work is the likeliest to be shared.
std::vector<oid> newest_first(const ObjectStore &store, const RefTable &refs) {
  std::vector<std::pair<std::int64_t, oid>> tips;
  OidSet seen;
  for (const auto &[name, id] : refs) {
    if (!store.contains(id) || !seen.insert(id).second) {
      continue;
    }
    const Object obj = store.get(id);
    const std::int64_t when =
        obj.type == consts::kTypeCommit ? parse_commit(obj.data).timestamp : 0;
    tips.emplace_back(when, id);
  }
  std::ranges::stable_sort(tips, [](const auto &a, const auto &b) { return a.first > b.first; });
  std::vector<oid> out;
  out.reserve(tips.size());
  for (const auto &[when, id] : tips) {
    out.push_back(id);
  }
  return out;
}

} // namespace

bool PushResult::all_ok() const {
  return std::ranges::all_of(refs, [](const RefResult &r) { return r.status == RefStatus::Ok; });
}

Client Client::connect(const std::string &host, int port, const PrivateKey *key,
                       std::chrono::milliseconds timeout) {
  return Client(connect_tcp(host, port), key, timeout);
}

Client::Client(UniqueFd fd, const PrivateKey *key, std::chrono::milliseconds timeout) {
  FdStream io(fd.get(), timeout);
  identity_ = offer_handshake(io, key);
  conn_ = std::make_unique<Connection>(std::move(fd), timeout);
  conn_->start();
}

void Client::close() {
  if (conn_) {
    conn_->shutdown();
    conn_->wait_closed();
  }
}

RefTable Client::ls_remote(std::string_view repository) {
  auto ch = start_channel(*conn_, Operation::Fetch, repository);
  const ChannelCloser closer(ch);
  PktReader in(*ch);
  RefTable refs = read_advertisement(in);
  PktWriter(*ch).flush(); // no wants
  return refs;
}

FetchResult Client::fetch(std::string_view repository, Repository &local) {
  auto ch = start_channel(*conn_, Operation::Fetch, repository);
  const ChannelCloser closer(ch);
  PktReader in(*ch);
  PktWriter out(*ch);

  FetchResult result;
  result.refs = read_advertisement(in);

  const ObjectStore &store = local.objects();
  std::vector<oid> wants;
  OidSet seen;
  for (const auto &[name, id] : result.refs) {
    if (!store.contains(id) && seen.insert(id).second) {
      wants.push_back(id);
    }
  }
  if (wants.empty()) {
    out.flush();
    ch->close();
    result.updated = mirror_refs(local, result.refs);
    return result;
  }
  for (const auto &w : wants) {
    out.write_line("want " + to_hex(w));
  }
  out.flush();

  const std::vector<oid> haves = newest_first(store, local.refs().list());
  bool ready = false;
  for (std::size_t i = 0; i < haves.size() && !ready; i += kHavesPerRound) {
    const std::size_t end = std::min(haves.size(), i + kHavesPerRound);
    for (std::size_t j = i; j < end; ++j) {
      out.write_line("have " + to_hex(haves[j]));
    }
    out.flush();
    // ACK/NAK lines only inform; "ready" means the pack follows right away.
    while (auto line = in.read_checked()) {
      ready = ready || *line == "ready";
    }
  }
  if (!ready) {
    out.write_line("done");
  }

  Quarantine quarantine(store);
  PktDataReader data(in);
  PackReader pack([&](std::uint8_t *dst, std::size_t n) { data.read_exact(dst, n); });
  std::vector<oid> received;
  received.reserve(pack.count());
  while (auto obj = pack.next()) {
    received.push_back(quarantine.put(obj->type, obj->data));
  }
  data.expect_end();
  ch->close();

  if (auto missing = find_missing_reference(quarantine, received)) {
    throw Error(Errc::IncompleteTransfer, "server sent a pack without " + to_hex(*missing));
  }
  for (const auto &w : wants) {
    if (!quarantine.contains(w)) {
      throw Error(Errc::IncompleteTransfer, "server did not send " + to_hex(w));
    }
  }
  quarantine.promote();
  result.objects_received = received.size();
  result.updated = mirror_refs(local, result.refs);
  return result;
}

PushResult Client::push(std::string_view repository, const Repository &local,
                        const std::vector<PushSpec> &updates) {
  auto ch = start_channel(*conn_, Operation::Push, repository);
  const ChannelCloser closer(ch);
  PktReader in(*ch);
  PktWriter out(*ch);
  const RefTable remote = read_advertisement(in);

  std::vector<oid> roots;
  for (const auto &u : updates) {
    oid old_value = kNullOid;
    if (u.expected_old) {
      old_value = *u.expected_old;
    } else if (auto it = remote.find(u.ref); it != remote.end()) {
      old_value = it->second;
    }
    out.write_line(to_hex(old_value) + " " + to_hex(u.new_value) + " " + u.ref);
    if (!is_null(u.new_value)) {
      roots.push_back(u.new_value);
    }
  }
  out.flush();

  PushResult result;
  if (!roots.empty()) {
    const ObjectStore &store = local.objects();
    std::vector<oid> haves;
    for (const auto &[name, id] : remote) {
      if (store.contains(id)) {
        haves.push_back(id);
      }
    }
    const auto ids = objects_to_send(store, roots, haves);
    PktDataWriter data(out);
    PackWriter pack([&](std::span<const std::uint8_t> bytes) { data.write(bytes); },
                    static_cast<std::uint32_t>(ids.size()));
    for (const auto &id : ids) {
      pack.add(store.get(id));
    }
    pack.finish();
    data.finish();
    result.objects_sent = ids.size();
  }

  if (!updates.empty()) {
    const auto unpack = in.read_checked();
    if (!unpack || *unpack != "unpack ok") {
      throw Error(Errc::Protocol, "unexpected push report");
    }
  }
  while (auto line = in.read_checked()) {
    if (line->starts_with("ok ")) {
      result.refs.push_back(RefResult{line->substr(3), RefStatus::Ok});
      continue;
    }
    const auto last = line->rfind(' ');
    std::optional<RefStatus> status;
    if (line->starts_with("ng ") && last > 2) {
      status = parse_ref_status(std::string_view(*line).substr(last + 1));
    }
    if (!status) {
      throw Error(Errc::Protocol, "malformed push report '" + *line + "'");
    }
    result.refs.push_back(RefResult{line->substr(3, last - 3), *status});
  }
  return result;
}

} // namespace gitdock
