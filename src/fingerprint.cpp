#include "iim/fingerprint.hpp"
#include <cstring>

namespace iim {

namespace {

// Streaming FNV-1a over the raw bytes of every value.
struct Fnv1a {
  std::uint64_t h = 1469598103934665603ull;

  void bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= p[i];
      h *= 1099511628211ull;
    }
  }

  void number(double x) {
    unsigned char raw[sizeof(double)];
    std::memcpy(raw, &x, sizeof(double));
    bytes(raw, sizeof(raw));
  }

  void text(const std::string& s) {
    bytes(s.data(), s.size());
    bytes("", 1);
  }
};

}

std::uint64_t hash_vector_fingerprint(const Vec& v) {
  Fnv1a f;
  for (auto x : v) f.number(x);
  return f.h;
}

std::uint64_t hash_results_fingerprint(const std::vector<ScenarioResult>& results) {
  Fnv1a f;
  for (const auto& r : results) {
    f.text(r.name);
    for (auto x : r.q) f.number(x);
  }
  return f.h;
}

}
