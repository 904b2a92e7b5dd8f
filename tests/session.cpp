#include "gitdock/client.hpp"
#include "gitdock/config.hpp"
#include "gitdock/consts.hpp"
#include "gitdock/error.hpp"
#include "gitdock/keys.hpp"
#include "gitdock/pack.hpp"
#include "gitdock/pktline.hpp"
#include "gitdock/protocol.hpp"
#include "gitdock/refs.hpp"
#include "gitdock/repo.hpp"
#include "gitdock/server.hpp"
#include "gitdock/session.hpp"
#include "gitdock/views.hpp"
#include "support.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <vector>

using namespace gitdock;
using namespace std::chrono_literals;
using test::expect;
using test::expect_error;

namespace {

constexpr auto kRoundTimeout = 1500ms;

struct Keys {
  PrivateKey alice = PrivateKey::generate(); // admin
  PrivateKey bob = PrivateKey::generate();   // reads team/*
  PrivateKey carol = PrivateKey::generate(); // writes everywhere, not admin
};

ServerConfig make_config(const test::TempDir &tmp, const Keys &keys) {
  ServerConfig cfg;
  cfg.listen_address = "127.0.0.1";
  cfg.port = 0;
  cfg.repo_root = tmp / "repos";
  cfg.round_limit = 2;
  cfg.round_timeout = kRoundTimeout;
  cfg.allow_guest = true;
  cfg.identities = {{"alice", keys.alice.public_key()},
                    {"bob", keys.bob.public_key()},
                    {"carol", keys.carol.public_key()}};
  cfg.admins = {"alice"};
  cfg.grants = {{"alice", "*", Capability::ReadWrite},
                {"bob", "team/*", Capability::Read},
                {"carol", "*", Capability::ReadWrite},
                {"guest", "public/*", Capability::ReadWrite}};
  cfg.protected_refs = {"refs/heads/release"};
  return cfg;
}

Repository make_local(const test::TempDir &tmp, const std::string &name) {
  Repository repo(tmp / name);
  repo.init();
  return repo;
}

// Runs the accept loop on a background thread for the lifetime of the object.
class RunningServer {
public:
  explicit RunningServer(ServerConfig cfg) : server_(std::move(cfg)) {
    server_.listen();
    thread_ = std::thread([this] { server_.run(); });
  }
  ~RunningServer() {
    server_.stop();
    thread_.join();
  }
  RunningServer(const RunningServer &) = delete;
  RunningServer &operator=(const RunningServer &) = delete;

  Server &operator*() { return server_; }
  Server *operator->() { return &server_; }
  Client connect(const PrivateKey *key) { return Client::connect("127.0.0.1", server_.port(), key); }

private:
  Server server_;
  std::thread thread_;
};

void push_and_conflicts(RunningServer &server, const Keys &keys, const test::TempDir &tmp) {
  auto alice = server.connect(&keys.alice);
  expect(alice.identity() == "alice", "welcomed as alice");

  Repository local = make_local(tmp, "alice.git");
  const oid c1 = test::commit_files(local, {{"README", "hello\n"}}, {}, "first", 100);

  // First push creates the repository.
  const auto first = alice.push("team/app.git", local, {{heads_ref("main"), c1, std::nullopt}});
  expect(first.all_ok() && first.refs.size() == 1, "first push accepted");
  expect(first.objects_sent == 3, "commit, tree and blob sent");
  const Repository remote(server->resolver().root() / "team/app.git");
  expect(remote.is_initialized(), "repository created by push");
  expect(remote.resolve_ref("refs/heads/main") == c1, "main set");
  expect(remote.resolve_ref("HEAD") == c1, "HEAD follows main");

  // A writer that still believes the ref is absent loses.
  const oid other = test::commit_files(local, {{"README", "other\n"}}, {}, "other", 110);
  const auto stale = alice.push("team/app.git", local, {{heads_ref("main"), other, kNullOid}});
  expect(stale.refs.size() == 1 && stale.refs[0].status == RefStatus::Conflict, "stale push");
  expect(remote.resolve_ref("refs/heads/main") == c1, "main unchanged after conflict");

  // Cached views of the repository are dropped once a ref moves.
  const MirrorView view(remote, "team/app.git", server->cache());
  (void)view.tree_listing(c1);
  const CacheKey listing{"team/app.git", c1, ViewKind::TreeListing};
  expect(server->cache().contains(listing), "listing cached");

  const oid c2 = test::commit_files(local, {{"README", "hello again\n"}}, {c1}, "second", 200);
  const auto ff = alice.push("team/app.git", local, {{heads_ref("main"), c2, std::nullopt}});
  expect(ff.all_ok(), "fast-forward accepted");
  expect(ff.objects_sent == 3, "only new objects sent, got " + std::to_string(ff.objects_sent));
  expect(remote.resolve_ref("refs/heads/main") == c2, "main advanced");
  expect(!server->cache().contains(listing), "cache invalidated by push");

  // Two writers racing for the same new ref: exactly one wins.
  {
    auto carol = server.connect(&keys.carol);
    const oid mine_a = test::commit_files(local, {{"race", "a\n"}}, {c2}, "race a", 210);
    const oid mine_b = test::commit_files(local, {{"race", "b\n"}}, {c2}, "race b", 211);
    PushResult ra;
    PushResult rb;
    std::atomic<int> errors{0};
    auto racer = [&](Client &who, const oid &value, PushResult &out) {
      return std::thread([&who, value, &out, &errors, &local] {
        try {
          out = who.push("team/app.git", local, {{"refs/heads/race", value, kNullOid}});
        } catch (const std::exception &e) {
          std::cerr << "racer: " << e.what() << "\n";
          ++errors;
        }
      });
    };
    std::thread ta = racer(alice, mine_a, ra);
    std::thread tb = racer(carol, mine_b, rb);
    ta.join();
    tb.join();
    expect(errors == 0, "racers completed");
    expect(ra.refs.size() == 1 && rb.refs.size() == 1, "both racers got a report");
    expect(ra.all_ok() != rb.all_ok(), "exactly one racer wins");
    const auto &loser = ra.all_ok() ? rb : ra;
    expect(loser.refs[0].status == RefStatus::Conflict, "loser sees a conflict");
    expect(remote.resolve_ref("refs/heads/race") == (ra.all_ok() ? mine_a : mine_b),
           "winner's value stored");
    expect(alice.push("team/app.git", local, {{"refs/heads/race", kNullOid, std::nullopt}}).all_ok(),
           "race ref removed");
  }

  // Deleting a ref needs no objects; an empty update list gets an empty report.
  expect(alice.push("team/app.git", local, {{"refs/heads/tmp", c1, std::nullopt}}).all_ok(),
         "create tmp");
  const auto del = alice.push("team/app.git", local, {{"refs/heads/tmp", kNullOid, std::nullopt}});
  expect(del.all_ok() && del.objects_sent == 0, "delete without pack");
  expect(!remote.refs().find("refs/heads/tmp"), "tmp deleted");
  expect(alice.push("team/app.git", local, {}).refs.empty(), "empty push");

  // Unknown repositories are not found for fetches.
  expect_error(Errc::NotFound, [&] { (void)alice.ls_remote("team/none.git"); }, "missing repo");
  expect_error(Errc::InvalidPath, [&] { (void)alice.ls_remote("../escape.git"); }, "bad path");
}

void permissions(RunningServer &server, const Keys &keys, const test::TempDir &tmp) {
  Repository local = make_local(tmp, "bob.git");
  const oid mine = test::commit_files(local, {{"b", "bob\n"}}, {}, "bob", 300);

  auto bob = server.connect(&keys.bob);
  const auto refs = bob.ls_remote("team/app.git");
  expect(refs.contains("refs/heads/main"), "reader sees refs");
  const Repository remote(server->resolver().root() / "team/app.git");
  const oid before = remote.resolve_ref("refs/heads/main");

  expect_error(Errc::Forbidden,
               [&] { (void)bob.push("team/app.git", local, {{heads_ref("main"), mine, before}}); },
               "read-only push");
  expect(remote.resolve_ref("refs/heads/main") == before, "ref untouched by forbidden push");
  expect(!remote.objects().contains(mine), "no objects stored by forbidden push");
  expect_error(Errc::Forbidden,
               [&] { (void)bob.push("team/new.git", local, {{heads_ref("main"), mine, std::nullopt}}); },
               "read-only create");
  expect(!std::filesystem::exists(server->resolver().root() / "team/new.git"),
         "forbidden push creates nothing");
  expect_error(Errc::NotFound, [&] { (void)bob.ls_remote("other/app.git"); },
               "no grant looks like a missing repository");

  // The connection survives failed channels.
  expect(bob.ls_remote("team/app.git") == refs, "session still usable");

  // Protected refs are for admins only.
  auto carol = server.connect(&keys.carol);
  const auto rejected =
      carol.push("team/app.git", local, {{"refs/heads/release", mine, std::nullopt},
                                         {"refs/heads/carol", mine, std::nullopt}});
  expect(rejected.refs.size() == 2, "two results");
  expect(rejected.refs[0].ref == "refs/heads/release" &&
             rejected.refs[0].status == RefStatus::Rejected,
         "protected ref rejected");
  expect(rejected.refs[1].status == RefStatus::Ok, "unprotected ref in the same push applied");
  auto alice = server.connect(&keys.alice);
  expect(alice.push("team/app.git", local, {{"refs/heads/release", mine, std::nullopt}}).all_ok(),
         "admin updates a protected ref");

  // Keys nobody configured are turned away during the handshake.
  const auto stranger = PrivateKey::generate();
  expect_error(Errc::Unauthenticated, [&] { (void)server.connect(&stranger); }, "unknown key");
}

void fetching(RunningServer &server, const Keys &keys, const test::TempDir &tmp) {
  auto alice = server.connect(&keys.alice);
  const Repository remote(server->resolver().root() / "team/app.git");
  const auto advertised = alice.ls_remote("team/app.git");
  expect(advertised == remote.refs().list(), "advertisement matches the ref table");

  Repository mirror = make_local(tmp, "mirror.git");
  const auto full = alice.fetch("team/app.git", mirror);
  expect(full.refs == advertised, "fetch reports the advertisement");
  expect(mirror.refs().list() == advertised, "refs mirrored");
  expect(full.objects_received > 0, "objects received");
  const oid main = mirror.resolve_ref("refs/heads/main");
  const auto parents = mirror.read_commit(main).parents;
  expect(parents.size() == 1 && mirror.objects().contains(parents[0]), "history fetched");

  const auto again = alice.fetch("team/app.git", mirror);
  expect(again.objects_received == 0 && again.updated.empty(), "nothing new");

  // Many unrelated haves: the server cuts negotiation at its round limit.
  for (int i = 0; i < 70; ++i) {
    const oid c = test::commit_files(mirror, {{"n", std::to_string(i)}}, {}, "local", 50 + i);
    expect(mirror.update_ref("refs/heads/local" + std::to_string(i), kNullOid, c) == RefUpdate::Ok,
           "local ref");
  }
  Repository writer = make_local(tmp, "writer.git");
  (void)alice.fetch("team/app.git", writer);
  const oid next = test::commit_files(writer, {{"README", "third\n"}}, {main}, "third", 500);
  expect(alice.push("team/app.git", writer, {{heads_ref("main"), next, std::nullopt}}).all_ok(),
         "third push");
  const auto incremental = alice.fetch("team/app.git", mirror);
  expect(incremental.objects_received == 3,
         "only the new commit travels, got " + std::to_string(incremental.objects_received));
  expect(mirror.resolve_ref("refs/heads/main") == next, "main updated");
  expect(mirror.refs().find("refs/heads/local69").has_value(), "local refs kept");

  // Several channels on one connection at once.
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i] {
      try {
        if (i % 2 == 0) {
          if (alice.ls_remote("team/app.git").at("refs/heads/main") != next) {
            ++failures;
          }
        } else {
          Repository copy = make_local(tmp, "copy" + std::to_string(i) + ".git");
          if (alice.fetch("team/app.git", copy).refs.at("refs/heads/main") != next ||
              !copy.objects().contains(next)) {
            ++failures;
          }
          const std::string ref = "refs/heads/worker" + std::to_string(i);
          if (!alice.push("team/app.git", copy, {{ref, next, std::nullopt}}).all_ok()) {
            ++failures;
          }
        }
      } catch (const std::exception &e) {
        std::cerr << "channel " << i << ": " << e.what() << "\n";
        ++failures;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  expect(failures == 0, "concurrent channels");
  expect(remote.refs().find("refs/heads/worker5") == next, "concurrent pushes applied");
}

void guests(RunningServer &server, const Keys &keys, const test::TempDir &tmp) {
  Repository local = make_local(tmp, "site.git");
  const oid c = test::commit_files(local, {{"index.html", "<p>hi</p>\n"}}, {}, "site", 600);
  auto alice = server.connect(&keys.alice);
  expect(alice.push("public/site.git", local, {{heads_ref("main"), c, std::nullopt}}).all_ok(),
         "publish");

  auto guest = server.connect(nullptr);
  expect(guest.identity() == "guest", "welcomed as guest");
  expect(guest.ls_remote("public/site.git").at("refs/heads/main") == c, "guest reads");
  Repository copy = make_local(tmp, "guest.git");
  expect(guest.fetch("public/site.git", copy).objects_received == 3, "guest fetches");
  expect_error(Errc::Forbidden,
               [&] { (void)guest.push("public/site.git", copy, {{"refs/heads/g", c, std::nullopt}}); },
               "guests never write");
  expect_error(Errc::NotFound, [&] { (void)guest.ls_remote("team/app.git"); }, "guest scope");
}

// Drives a push engine directly with a pack whose commit lacks its parent.
void incomplete_push(RunningServer &server, const test::TempDir &tmp) {
  const Repository remote(server->resolver().root() / "team/app.git");
  const oid before = remote.resolve_ref("refs/heads/main");

  Repository scratch = make_local(tmp, "scratch.git");
  const oid parent = test::commit_files(scratch, {{"p", "orphan parent\n"}}, {}, "p", 700);
  const oid child = test::commit_files(scratch, {{"c", "orphan child\n"}}, {parent}, "c", 701);
  const oid tree = scratch.read_commit(child).tree;
  const std::vector<oid> sent{child, tree, scratch.read_tree(tree).at(0).id};

  int sv[2];
  expect(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0, "socketpair");
  UniqueFd server_end(sv[0]);
  UniqueFd client_end(sv[1]);

  FdStream server_io(server_end.get(), kRoundTimeout);
  Engine engine(server->context(), Identity{"alice", true, false}, server_io, "test");
  std::thread runner([&] { engine.run(); });

  FdStream io(client_end.get(), kRoundTimeout);
  PktWriter out(io);
  PktReader in(io);
  out.write_line(format_channel_command(Operation::Push, "team/app.git"));
  while (in.read_checked()) {
  }
  out.write_line(to_hex(before) + " " + to_hex(child) + " refs/heads/main");
  out.flush();
  PktDataWriter data(out);
  PackWriter pack([&](std::span<const std::uint8_t> b) { data.write(b); },
                  static_cast<std::uint32_t>(sent.size()));
  for (const auto &id : sent) {
    pack.add(scratch.get(id));
  }
  pack.finish();
  data.finish();

  expect_error(Errc::IncompleteTransfer, [&] { (void)in.read_checked(); }, "missing parent");
  runner.join();
  expect(engine.failure() == Errc::IncompleteTransfer, "engine failure recorded");
  expect(remote.resolve_ref("refs/heads/main") == before, "ref unchanged");
  expect(!remote.objects().contains(child), "quarantined objects discarded");
}

// The second update names a ref below an existing ref file, so it cannot be
// stored. The first one still lands and drops the repository's cached views.
void ref_name_clash(RunningServer &server) {
  Repository remote(server->resolver().root() / "team/app.git");
  const oid main = remote.resolve_ref("refs/heads/main");
  const MirrorView view(remote, "team/app.git", server->cache());
  (void)view.tree_listing(main);
  const CacheKey listing{"team/app.git", main, ViewKind::TreeListing};
  expect(server->cache().contains(listing), "listing cached before the push");

  int sv[2];
  expect(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0, "socketpair");
  UniqueFd server_end(sv[0]);
  UniqueFd client_end(sv[1]);

  FdStream server_io(server_end.get(), kRoundTimeout);
  Engine engine(server->context(), Identity{"alice", true, false}, server_io, "clash");
  std::thread runner([&] { engine.run(); });

  std::vector<std::string> report;
  std::string client_error;
  try {
    FdStream io(client_end.get(), kRoundTimeout);
    PktWriter out(io);
    PktReader in(io);
    out.write_line(format_channel_command(Operation::Push, "team/app.git"));
    while (in.read_checked()) {
    }
    out.write_line(to_hex(kNullOid) + " " + to_hex(main) + " refs/heads/topic");
    out.write_line(to_hex(kNullOid) + " " + to_hex(main) + " refs/heads/main/sub");
    out.flush();
    PktDataWriter data(out);
    PackWriter pack([&](std::span<const std::uint8_t> b) { data.write(b); }, 0);
    pack.finish();
    data.finish();
    while (auto line = in.read_checked()) {
      report.push_back(*line);
    }
  } catch (const std::exception &e) {
    client_error = e.what();
  }
  runner.join();

  expect(client_error.empty(), "client: " + client_error);
  expect(!engine.failure(), "push completed");
  expect(report == std::vector<std::string>{"unpack ok", "ok refs/heads/topic",
                                            "ng refs/heads/main/sub rejected"},
         "per-ref report");
  expect(remote.resolve_ref("refs/heads/topic") == main, "first ref stored");
  expect(!remote.refs().find("refs/heads/main/sub"), "clashing ref absent");
  expect(remote.resolve_ref("refs/heads/main") == main, "main untouched");
  expect(!server->cache().contains(listing), "cache invalidated by the stored ref");
  expect(remote.update_ref("refs/heads/topic", main, kNullOid) == RefUpdate::Ok, "topic removed");
}

bool has_incoming(const Repository &repo) {
  for (const auto &entry : std::filesystem::directory_iterator(repo.objects().dir())) {
    if (entry.path().filename().string().starts_with(consts::kIncomingPrefix)) {
      return true;
    }
  }
  return false;
}

// Tearing the transport down in the middle of a pack cancels the channel.
// Nothing it staged survives and no ref moves.
void cancelled_push(RunningServer &server, const test::TempDir &tmp) {
  const Repository remote(server->resolver().root() / "team/app.git");
  const oid before = remote.resolve_ref("refs/heads/main");
  expect(!has_incoming(remote), "no quarantine to begin with");

  // Incompressible, so the pack spans many packets.
  std::string noise(256 * 1024, '\0');
  std::uint32_t x = 12345;
  for (auto &c : noise) {
    x = x * 1103515245U + 12345U;
    c = static_cast<char>(x >> 24);
  }
  Repository scratch = make_local(tmp, "cancel.git");
  const oid commit = test::commit_files(scratch, {{"noise.bin", noise}}, {}, "noise", 800);
  const oid blob = scratch.read_tree(scratch.read_commit(commit).tree).at(0).id;

  int sv[2];
  expect(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0, "socketpair");

  std::promise<std::optional<Errc>> outcome;
  auto failure = outcome.get_future();
  std::thread worker;
  Connection server_side(UniqueFd(sv[0]), 10s);
  server_side.start([&](std::shared_ptr<Channel> ch) {
    worker = std::thread([&outcome, &server, ch] {
      Engine engine(server->context(), Identity{"alice", true, false}, *ch, "cancel");
      engine.run();
      ch->close();
      outcome.set_value(engine.failure());
    });
  });

  bool staged = false;
  std::string client_error;
  try {
    Connection client_side(UniqueFd(sv[1]), 10s);
    client_side.start();
    auto ch = client_side.open_channel();
    PktWriter out(*ch);
    PktReader in(*ch);
    out.write_line(format_channel_command(Operation::Push, "team/app.git"));
    while (in.read_checked()) {
    }
    out.write_line(to_hex(before) + " " + to_hex(commit) + " refs/heads/main");
    out.flush();
    PktDataWriter data(out);
    PackWriter pack([&](std::span<const std::uint8_t> b) { data.write(b); }, 3);
    pack.add(scratch.get(blob)); // the commit and tree never follow

    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (!(staged = has_incoming(remote)) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(10ms);
    }
    client_side.shutdown();
  } catch (const std::exception &e) {
    client_error = e.what();
  }

  const bool finished = failure.wait_for(10s) == std::future_status::ready;
  server_side.shutdown();
  server_side.wait_closed();
  if (worker.joinable()) {
    worker.join();
  }
  expect(client_error.empty(), "client: " + client_error);
  expect(staged, "push was staged in a quarantine");
  expect(finished && failure.get() == Errc::Cancelled, "channel cancelled");
  expect(!has_incoming(remote), "quarantine removed");
  expect(remote.resolve_ref("refs/heads/main") == before, "ref unchanged");
  expect(!remote.objects().contains(blob), "staged blob discarded");
}

// Channel threads are joined as they finish, not when the connection ends.
void channel_threads_reaped(RunningServer &server, const Keys &keys) {
  int sv[2];
  expect(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0, "socketpair");
  Session session(UniqueFd(sv[0]), server->context(), kRoundTimeout, 77);
  std::thread runner([&] { session.run(); });

  constexpr int kChannels = 40;
  std::size_t live = 0;
  std::string client_error;
  try {
    UniqueFd fd(sv[1]);
    {
      FdStream io(fd.get(), kRoundTimeout);
      expect(offer_handshake(io, &keys.alice) == "alice", "handshake");
    }
    Connection conn(std::move(fd), 10s);
    conn.start();
    for (int i = 0; i < kChannels; ++i) {
      auto ch = conn.open_channel();
      PktWriter out(*ch);
      PktReader in(*ch);
      out.write_line(format_channel_command(Operation::Fetch, "team/app.git"));
      while (in.read_checked()) {
      }
      out.flush(); // no wants
      expect_error(Errc::Cancelled, [&] { (void)in.read(); }, "server closes the channel");
      ch->close();
    }
    live = session.channel_threads();
  } catch (const std::exception &e) {
    client_error = e.what();
  }
  runner.join();

  expect(client_error.empty(), "client: " + client_error);
  expect(live < 10, "finished threads joined while connected, " + std::to_string(live) + " left");
  expect(session.channel_threads() == 0, "all threads joined once closed");
}

void stalled_peers(RunningServer &server, const Keys &keys) {
  // Silent before the handshake.
  {
    auto fd = connect_tcp("127.0.0.1", server->port());
    FdStream io(fd.get());
    PktReader in(io);
    const auto start = std::chrono::steady_clock::now();
    expect_error(Errc::Timeout, [&] { (void)in.read_checked(); }, "stalled handshake");
    expect(std::chrono::steady_clock::now() - start >= 1s, "waited for the round timeout");
  }
  // Nonsense instead of hello.
  {
    auto fd = connect_tcp("127.0.0.1", server->port());
    FdStream io(fd.get());
    PktWriter(io).write_line("bonjour");
    PktReader in(io);
    expect_error(Errc::Protocol, [&] { (void)in.read_checked(); }, "bad hello");
  }
  // Silent on a channel after authenticating.
  {
    auto fd = connect_tcp("127.0.0.1", server->port());
    {
      FdStream io(fd.get());
      expect(offer_handshake(io, &keys.alice) == "alice", "handshake");
    }
    Connection conn(std::move(fd), 10s);
    conn.start();
    auto ch = conn.open_channel();
    PktReader in(*ch);
    expect_error(Errc::Timeout, [&] { (void)in.read_checked(); }, "stalled channel");
    ch->close();
  }
}

} // namespace

int main() {
  try {
    test::TempDir tmp("session");
    const Keys keys;
    RunningServer server(make_config(tmp, keys));
    expect(server->port() > 0, "ephemeral port bound");

    push_and_conflicts(server, keys, tmp);
    permissions(server, keys, tmp);
    fetching(server, keys, tmp);
    guests(server, keys, tmp);
    incomplete_push(server, tmp);
    ref_name_clash(server);
    cancelled_push(server, tmp);
    channel_threads_reaped(server, keys);
    stalled_peers(server, keys);
  } catch (const std::exception &e) {
    std::cerr << "session: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
