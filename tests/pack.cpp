#include "gitdock/consts.hpp"
#include "gitdock/pack.hpp"
#include "gitdock/pktline.hpp"
#include "support.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

using namespace gitdock;
using test::expect;

namespace {

// In-memory stream: reads from `input`, appends writes to `output`.
class MemoryStream : public ByteStream {
public:
  explicit MemoryStream(std::string input = {}) : input_(std::move(input)) {}

  std::size_t read_some(std::uint8_t *dst, std::size_t n) override {
    const std::size_t take = std::min(n, input_.size() - off_);
    std::memcpy(dst, input_.data() + off_, take);
    off_ += take;
    return take;
  }
  void write(std::span<const std::uint8_t> data) override {
    output_.append(reinterpret_cast<const char *>(data.data()), data.size());
  }
  void close_write() override {}
  using ByteStream::write;

  [[nodiscard]] const std::string &output() const { return output_; }

private:
  std::string input_;
  std::size_t off_{0};
  std::string output_;
};

Object make_object(std::string_view type, const std::string &text) {
  return Object{std::string(type), std::vector<std::uint8_t>(text.begin(), text.end())};
}

std::string write_pack(const std::vector<Object> &objects) {
  std::string out;
  PackWriter pack(
      [&](std::span<const std::uint8_t> b) {
        out.append(reinterpret_cast<const char *>(b.data()), b.size());
      },
      static_cast<std::uint32_t>(objects.size()));
  for (const auto &o : objects) {
    pack.add(o);
  }
  pack.finish();
  return out;
}

std::vector<Object> read_pack(const std::string &bytes) {
  std::size_t off = 0;
  PackReader pack([&](std::uint8_t *dst, std::size_t n) {
    if (bytes.size() - off < n) {
      throw Error(Errc::Protocol, "truncated");
    }
    std::memcpy(dst, bytes.data() + off, n);
    off += n;
  });
  std::vector<Object> out;
  while (auto o = pack.next()) {
    out.push_back(std::move(*o));
  }
  return out;
}

} // namespace

int main() {
  try {
    // pkt-line framing
    {
      MemoryStream s;
      PktWriter w(s);
      w.write_line("hello");
      w.flush();
      w.error("forbidden: no push for you");
      expect(s.output() == "000ahello\n00000023ERR forbidden: no push for you\n",
             "pkt-line encoding");

      MemoryStream r(s.output());
      PktReader reader(r);
      expect(reader.read_line() == "hello", "line read");
      expect(!reader.read(), "flush read");
      try {
        (void)reader.read_checked();
        expect(false, "ERR line raises");
      } catch (const Error &e) {
        expect(e.code() == Errc::Forbidden, "ERR carries the error code");
        expect(std::string(e.what()) == "no push for you", "ERR carries the message");
      }
    }
    {
      MemoryStream r("00zzjunk");
      PktReader reader(r);
      test::expect_error(Errc::Protocol, [&] { (void)reader.read(); }, "bad length header");
      MemoryStream cut("0010abc");
      PktReader short_reader(cut);
      test::expect_error(Errc::Protocol, [&] { (void)short_reader.read(); }, "truncated packet");
    }
    {
      // Arbitrary-size data split across packets, ended by a flush.
      std::string big(200000, '\0');
      for (std::size_t i = 0; i < big.size(); ++i) {
        big[i] = static_cast<char>(i * 31);
      }
      MemoryStream s;
      PktWriter w(s);
      PktDataWriter dw(w);
      dw.write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(big.data()),
                                             big.size()));
      dw.finish();

      MemoryStream r(s.output());
      PktReader pr(r);
      PktDataReader dr(pr);
      std::string back(big.size(), '\0');
      dr.read_exact(reinterpret_cast<std::uint8_t *>(back.data()), back.size());
      dr.expect_end();
      expect(back == big, "data stream across packets");
    }

    // Pack round trip, including an empty blob and binary content.
    const std::vector<Object> objects{
        make_object(consts::kTypeBlob, "hello\n"),
        make_object(consts::kTypeBlob, ""),
        make_object(consts::kTypeBlob, std::string("\0\x01\x02", 3)),
        make_object(consts::kTypeCommit, "tree 0000000000000000000000000000000000000000\n\nm\n"),
    };
    const std::string bytes = write_pack(objects);
    expect(bytes.starts_with("PACK"), "magic");
    const auto back = read_pack(bytes);
    expect(back.size() == objects.size(), "object count");
    for (std::size_t i = 0; i < back.size(); ++i) {
      expect(back[i].type == objects[i].type && back[i].data == objects[i].data,
             "object " + std::to_string(i) + " intact");
    }
    expect(read_pack(write_pack({})).empty(), "empty pack");

    // Any single corrupted byte is detected.
    for (const std::size_t pos : {std::size_t{5}, std::size_t{13}, bytes.size() / 2,
                                  bytes.size() - 1}) {
      std::string bad = bytes;
      bad[pos] = static_cast<char>(bad[pos] ^ 0x5a);
      test::expect_error(Errc::Protocol, [&] { (void)read_pack(bad); },
                         "corruption at byte " + std::to_string(pos));
    }
    test::expect_error(Errc::Protocol, [&] { (void)read_pack(bytes.substr(0, bytes.size() - 7)); },
                       "truncated pack");

    // An entry that inflates past its declared size is cut off at that size.
    {
      std::string bomb = write_pack({make_object(consts::kTypeBlob, std::string(8 << 20, '\0'))});
      const char declared[4] = {0, 0, 0, 10};
      bomb.replace(13, 4, declared, 4); // size field of the first entry
      try {
        (void)read_pack(bomb);
        expect(false, "oversized entry raises");
      } catch (const Error &e) {
        expect(e.code() == Errc::Protocol, "oversized entry is a protocol error");
        const std::string_view what = e.what();
        expect(what.find("inflates past 10 bytes") != std::string_view::npos,
               "inflation stopped at the declared size, got: " + std::string(what));
      }
    }

    // A writer that announces more than it adds refuses to finish.
    bool threw = false;
    try {
      PackWriter short_pack([](std::span<const std::uint8_t>) {}, 2);
      short_pack.add(objects[0]);
      short_pack.finish();
    } catch (const std::logic_error &) {
      threw = true;
    }
    expect(threw, "short pack rejected by the writer");
  } catch (const std::exception &e) {
    std::cerr << "pack: " << e.what() << "\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
