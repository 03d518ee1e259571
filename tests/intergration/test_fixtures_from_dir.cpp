#include "stream_json/event_parser.hpp"

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool ieq_ext(const std::string& s, const char* ext) {
  if (s.size() != std::strlen(ext)) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(ext[i]))) return false;
  return true;
}

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  return true;
}

static bool slurp(const fs::path& p, std::string& out) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

struct Res {
  bool ok{true};
  uint64_t events{0};
  uint64_t scalars{0};
  uint64_t copied{0};
  std::string err;
  std::string last_path;
};

// chunk == 0 feeds the whole document at once
static Res run_json(const std::string& doc, std::size_t chunk) {
  Res r;
  sj::EventParser parser;
  auto on_event = [&](const sj::Event& e) {
    ++r.events;
    if (e.is_scalar()) ++r.scalars;
    r.last_path.assign(e.path.data(), e.path.size());
  };

  if (chunk == 0) chunk = doc.empty() ? 1 : doc.size();
  bool ok = true;
  for (std::size_t i = 0; ok && i < doc.size(); i += chunk) {
    ok = parser.feed(std::string_view(doc).substr(i, chunk), on_event);
  }
  if (ok) ok = parser.finish(on_event);

  r.ok = ok;
  r.copied = parser.lexer().stats().copied_tokens;
  if (!ok) r.err = parser.error_message();
  return r;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  const std::vector<std::size_t> chunk_sizes = {0, 1, 3, 7, 64};

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (!ieq_ext(p.extension().string(), ".json")) continue;

    std::string doc;
    if (!slurp(p, doc)) {
      std::cerr << "[ERR] cannot read " << p << "\n";
      ++total; ++failed;
      continue;
    }

    const bool expect_ok = expected_ok_for(p);
    const Res whole = run_json(doc, 0);
    bool verdict = (whole.ok == expect_ok);

    // every chunking must agree with the single-buffer run
    std::size_t bad_chunk = 0;
    for (std::size_t c : chunk_sizes) {
      if (c == 0) continue;
      const Res r = run_json(doc, c);
      if (r.ok != whole.ok || r.events != whole.events || r.err != whole.err || r.last_path != whole.last_path) {
        verdict = false;
        bad_chunk = c;
        break;
      }
    }

    ++total; verdict ? ++passed : ++failed;

    if (verdict) {
      std::cout << "[PASS] " << p.filename().string()
                << "  events=" << whole.events
                << "  scalars=" << whole.scalars
                << "  bytes=" << doc.size()
                << "  expected_ok=" << (expect_ok?"true":"false") << "\n";
      if (!whole.ok)
        std::cout << "       error: " << whole.err << "\n";
    } else {
      std::cout << "[FAIL] " << p.filename().string()
                << "  events=" << whole.events
                << "  bytes=" << doc.size()
                << "  expected_ok=" << (expect_ok?"true":"false")
                << "  actual_ok=" << (whole.ok?"true":"false") << "\n";
      if (!whole.err.empty())
        std::cout << "       error: " << whole.err << "\n";
      if (bad_chunk)
        std::cout << "       chunk size " << bad_chunk << " disagrees with the whole-buffer run\n";
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  if (total == 0) { std::cerr << "[ERR] no .json fixtures in " << dir << "\n"; return 2; }
  return failed == 0 ? 0 : 1;
}
