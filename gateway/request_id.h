#pragma once

// Request identifiers returned as X-Request-ID and stamped on usage records.

#include <chrono>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace modelgate {

namespace detail {
inline uint64_t RandomU64() {
  // Per-thread RNG seeded from the clock and the thread-local's address.
  static thread_local std::mt19937_64 rng{
      static_cast<uint64_t>(
          std::chrono::steady_clock::now().time_since_epoch().count()) ^
      reinterpret_cast<uintptr_t>(&rng)};
  return rng();
}
}  // namespace detail

// Generates a lowercase hex string encoding `bytes` random bytes.
// `bytes` must be a multiple of 8.
inline std::string RandomHex(std::size_t bytes) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < bytes / 8; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(16) << detail::RandomU64();
  }
  return oss.str();
}

// 32 hex characters.
inline std::string NewRequestId() { return RandomHex(16); }

// A caller-supplied X-Request-ID is echoed only when it is 1..128 characters
// of [A-Za-z0-9._-]; anything else gets a fresh id.
inline bool IsAcceptableRequestId(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' &&
        c != '.') {
      return false;
    }
  }
  return true;
}

}  // namespace modelgate
