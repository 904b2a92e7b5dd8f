#include "gitdock/consts.hpp"
#include "gitdock/object_store.hpp"
#include "gitdock/repo.hpp"
#include "support.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using namespace gitdock;
using test::expect;

int main() {
  const test::TempDir tmp("objects");
  try {
    Repository repo{tmp / "repo.git"};
    repo.init();
    expect(repo.is_initialized(), "init creates HEAD and objects/");
    expect(repo.refs().list().empty(), "new repository has no refs");
    expect(repo.refs().read_head() == "ref: refs/heads/main", "HEAD points at main");

    // Content addressing: same bytes, same id, one file.
    const std::string content = "hello\n";
    const oid a = repo.write_blob(content);
    const oid b = repo.write_blob(content);
    expect(a == b, "put is idempotent");
    expect(to_hex(a) == "ce013625030ba8dba906f756967f9e9ca394464a", "blob id matches git");
    const auto back = repo.get(a);
    expect(back.type == consts::kTypeBlob, "type survives");
    expect(std::string(back.data.begin(), back.data.end()) == content, "bytes survive");

    std::size_t files = 0;
    repo.objects().for_each_id([&](const oid &) { ++files; });
    expect(files == 1, "second put writes nothing");

    // Binary content, including NUL and an empty payload.
    const std::string binary("\x00\x01\xff\x00zz", 6);
    expect(repo.read_blob(repo.write_blob(binary)) ==
               std::vector<std::uint8_t>(binary.begin(), binary.end()),
           "binary blob round trip");
    expect(repo.read_blob(repo.write_blob("")).empty(), "empty blob");

    oid absent{};
    absent.fill(0xab);
    expect(!repo.objects().contains(absent), "absent object");
    test::expect_error(Errc::ObjectMissing, [&] { (void)repo.get(absent); }, "get of absent id");

    // Typed views.
    const oid c1 = test::commit_files(repo, {{"b.txt", "B\n"}, {"a.txt", "A\n"}}, {}, "first",
                                      1700000000);
    const oid c2 = test::commit_files(repo, {{"a.txt", "A2\n"}}, {c1}, "second", 1700000100);
    const CommitView v = repo.read_commit(c2);
    expect(v.parents.size() == 1 && v.parents[0] == c1, "parent parsed");
    expect(v.timestamp == 1700000100, "committer time parsed");
    expect(v.message == "second\n", "message parsed");
    expect(v.author == test::signature(1700000100), "author parsed");

    const auto entries = repo.read_tree(repo.read_commit(c1).tree);
    expect(entries.size() == 2 && entries[0].name == "a.txt" && entries[1].name == "b.txt",
           "tree entries sorted by name");
    expect(entries[0].mode == consts::kModeFile && !entries[0].is_tree(), "entry mode parsed");

    bool threw = false;
    try {
      (void)repo.read_tree(c1);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    expect(threw, "read_tree rejects a commit");

    const std::string tag_text = "object " + to_hex(c2) +
                                 "\ntype commit\ntag v1.0\ntagger " + test::signature(1) +
                                 "\n\nrelease\n";
    const oid tag = repo.objects().put(consts::kTypeTag, tag_text);
    const auto tv = parse_tag(repo.get(tag).data);
    expect(tv.object == c2 && tv.type == "commit" && tv.name == "v1.0", "tag parsed");

    // Quarantine: invisible to the store until promoted, gone when dropped.
    oid staged{};
    {
      Quarantine q(repo.objects());
      staged = q.put(consts::kTypeBlob, std::span<const std::uint8_t>(
                                            reinterpret_cast<const std::uint8_t *>("q1"), 2));
      expect(q.contains(staged), "quarantine sees its own objects");
      expect(q.contains(a), "quarantine sees the main store");
      expect(!repo.objects().contains(staged), "main store does not see staged objects");
    }
    expect(!repo.objects().contains(staged), "dropped quarantine leaves nothing behind");
    {
      Quarantine q(repo.objects());
      staged = q.put(consts::kTypeBlob, std::span<const std::uint8_t>(
                                            reinterpret_cast<const std::uint8_t *>("q2"), 2));
      q.promote();
    }
    expect(repo.objects().contains(staged), "promoted object is in the main store");
    for (const auto &entry : std::filesystem::directory_iterator(repo.objects_dir())) {
      expect(!entry.path().filename().string().starts_with(consts::kIncomingPrefix),
             "no staging directory left over");
    }
  } catch (const std::exception &e) {
    std::cerr << "object_store: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
