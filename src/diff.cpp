#include "gitdock/diff.hpp"

#include <algorithm>
#include <sstream>

namespace gitdock::diff {

namespace {

constexpr std::size_t kBinaryProbe = 8000;

struct Op {
  char kind;      // '=' keep, '-' del, '+' add
  std::size_t ai; // position in `a` before this op
  std::size_t bi; // position in `b` before this op
};

// Myers O(ND) diff to produce ops: '=' keep, '-' del, '+' add.
std::vector<char> myers_diff(const std::vector<std::string> &a,
                             const std::vector<std::string> &b) {
  const int N = static_cast<int>(a.size());
  const int M = static_cast<int>(b.size());
  const int MAX = N + M;
  const int OFFSET = MAX;
  std::vector<int> v(2 * MAX + 2, 0);
  std::vector<std::vector<int>> trace;
  trace.reserve(MAX + 1);

  for (int d = 0; d <= MAX; ++d) {
    trace.push_back(v); // snapshot before exploring this D layer
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1];     // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && a[x] == b[y]) { ++x; ++y; }
      v[OFFSET + k] = x;
      if (x < N || y < M) {
        continue;
      }
      std::vector<char> rev_ops;
      int cx = N, cy = M;
      for (int dd = d; dd >= 0; --dd) {
        const auto &vv = trace[dd];
        const int kk = cx - cy;
        int prev_k;
        bool down;
        if (kk == -dd || (kk != dd && vv[OFFSET + kk - 1] < vv[OFFSET + kk + 1])) {
          prev_k = kk + 1; down = true;
        } else { prev_k = kk - 1; down = false; }
        int px = vv[OFFSET + prev_k];
        const int py = px - prev_k;
        if (!down) ++px; // came from right => consumed from a
        while (cx > px && cy > py) { rev_ops.push_back('='); --cx; --cy; }
        if (dd > 0) rev_ops.push_back(down ? '+' : '-');
        cx = down ? px : px - 1;
        cy = py;
      }
      return {rev_ops.rbegin(), rev_ops.rend()};
    }
  }
  return {};
}

// "-3,4" / "+5" / "-0,0"; git leaves out a count of one.
void write_range(std::ostringstream &out, char sign, std::size_t start, std::size_t count) {
  out << sign << (count == 0 ? start : start + 1);
  if (count != 1) {
    out << ',' << count;
  }
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

bool looks_binary(std::string_view content) {
  return content.substr(0, kBinaryProbe).find('\0') != std::string_view::npos;
}

std::string unified_diff(const std::vector<std::string> &a, const std::vector<std::string> &b,
                         std::string_view path, std::size_t context) {
  std::vector<Op> ops;
  ops.reserve(a.size() + b.size());
  std::size_t ia = 0;
  std::size_t ib = 0;
  for (const char kind : myers_diff(a, b)) {
    ops.push_back(Op{kind, ia, ib});
    if (kind != '+') ++ia;
    if (kind != '-') ++ib;
  }

  std::vector<std::size_t> changes;
  for (std::size_t i = 0; i < ops.size(); ++i) {
    if (ops[i].kind != '=') {
      changes.push_back(i);
    }
  }
  if (changes.empty()) {
    return {};
  }

  std::ostringstream out;
  out << "--- a/" << path << "\n";
  out << "+++ b/" << path << "\n";

  std::size_t c = 0;
  while (c < changes.size()) {
    // Changes separated by at most 2*context unchanged lines share a hunk.
    std::size_t last = c;
    while (last + 1 < changes.size() && changes[last + 1] - changes[last] - 1 <= 2 * context) {
      ++last;
    }
    const std::size_t begin = changes[c] > context ? changes[c] - context : 0;
    const std::size_t end = std::min(ops.size(), changes[last] + 1 + context);

    std::size_t old_count = 0;
    std::size_t new_count = 0;
    for (std::size_t i = begin; i < end; ++i) {
      if (ops[i].kind != '+') ++old_count;
      if (ops[i].kind != '-') ++new_count;
    }
    out << "@@ ";
    write_range(out, '-', ops[begin].ai, old_count);
    out << ' ';
    write_range(out, '+', ops[begin].bi, new_count);
    out << " @@\n";
    for (std::size_t i = begin; i < end; ++i) {
      const Op &op = ops[i];
      if (op.kind == '+') {
        out << '+' << b[op.bi] << "\n";
      } else {
        out << (op.kind == '=' ? ' ' : '-') << a[op.ai] << "\n";
      }
    }
    c = last + 1;
  }
  return out.str();
}

} // namespace gitdock::diff
