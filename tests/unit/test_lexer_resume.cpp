#include "stream_json/lexer.hpp"
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// Any split of the input into chunks must give the same tokens as one chunk.

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Tok {
  sj::TokenKind kind;
  std::string text;
  std::uint64_t offset;
  bool operator==(const Tok& o) const { return kind == o.kind && text == o.text && offset == o.offset; }
};

struct Run {
  sj::Status status = sj::Status::NeedMoreData;
  sj::ErrorCode code = sj::ErrorCode::None;
  std::uint64_t err_offset = 0;
  std::vector<Tok> toks;
};

static Run lex_chunks(const std::vector<std::string>& chunks) {
  Run r;
  sj::Lexer lx;
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (i + 1 == chunks.size()) lx.finish();
    for (;;) {
      sj::Token t;
      r.status = lx.advance(chunks[i], t);
      if (r.status != sj::Status::Ok) break;
      r.toks.push_back(Tok{t.kind, std::string(t.text), t.offset});
    }
    if (r.status == sj::Status::Error) {
      r.code = lx.error().code;
      r.err_offset = lx.error().offset;
      break;
    }
  }
  return r;
}

static std::vector<std::string> split_at(const std::string& s, std::size_t k) {
  return {s.substr(0, k), s.substr(k)};
}

static std::vector<std::string> bytewise(const std::string& s) {
  std::vector<std::string> out;
  for (char c : s) out.emplace_back(1, c);
  if (out.empty()) out.emplace_back();
  return out;
}

static std::vector<std::string> random_split(const std::string& s, std::mt19937& rng) {
  std::uniform_int_distribution<int> len{1, 9};
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < s.size()) {
    std::size_t n = static_cast<std::size_t>(len(rng));
    out.push_back(s.substr(i, n));
    i += n;
  }
  if (out.empty()) out.emplace_back();
  return out;
}

static bool same(const Run& a, const Run& b) {
  return a.status == b.status && a.code == b.code && a.err_offset == b.err_offset && a.toks == b.toks;
}

static void check_doc(const std::string& name, const std::string& doc) {
  const Run ref = lex_chunks({doc});

  for (std::size_t k = 0; k <= doc.size(); ++k) {
    if (!same(ref, lex_chunks(split_at(doc, k)))) {
      expect(false, name + ": two-chunk split at " + std::to_string(k) + " differs");
      return;
    }
  }
  if (!same(ref, lex_chunks(bytewise(doc)))) expect(false, name + ": byte-by-byte differs");

  std::mt19937 rng(42);
  for (int i = 0; i < 50; ++i) {
    if (!same(ref, lex_chunks(random_split(doc, rng)))) {
      expect(false, name + ": random split differs");
      return;
    }
  }
}

int main(){
  const std::string escapes =
      R"({"key":"with\nnewlines\n","u":"\u00e9\ud83d\ude03","q":"\"\\\/\b\f\r\t"})";
  const std::string scalars =
      R"([-12.5e+3, 0, 1E9, true, false, null, "plain", ""])";
  const std::string raw_utf8 =
      "{\"raw\":\"h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x83\",\"k\":[\"\xE4\xBD\xA0\"]}";
  const std::string bad_escape = R"(["ok", "bad\q"])";
  const std::string bad_utf8 = "[\"a\xE2\x82\"]";

  // reference results are what the rest depends on
  {
    const Run r = lex_chunks({escapes});
    expect(r.status == sj::Status::EndOfDocument, "escapes: one chunk parses");
    bool found = false;
    for (auto& t : r.toks) {
      if (t.text == "with\nnewlines\n") found = true;
    }
    expect(found, "escapes: newline escapes decoded");
  }
  {
    const Run r = lex_chunks({bad_escape});
    expect(r.status == sj::Status::Error && r.code == sj::ErrorCode::InvalidEscape, "bad escape fails");
    expect(r.err_offset == 12, "bad escape offset points at the escape character");
  }
  {
    const Run r = lex_chunks({bad_utf8});
    expect(r.status == sj::Status::Error && r.code == sj::ErrorCode::InvalidUtf8, "truncated utf-8 sequence fails");
  }

  check_doc("escapes", escapes);
  check_doc("scalars", scalars);
  check_doc("raw_utf8", raw_utf8);
  check_doc("bad_escape", bad_escape);
  check_doc("bad_utf8", bad_utf8);

  if (failures) { std::cerr << "[FAIL] lexer_resume: " << failures << " check(s)\n"; return 1; }
  std::cout << "[PASS] lexer_resume\n";
  return 0;
}
