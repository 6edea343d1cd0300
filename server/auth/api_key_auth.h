#pragma once

#include <string>
#include <vector>

namespace modelgate {

enum class Quota { kUnlimited };

// Parses a configured quota name. Only "unlimited" exists today; anything
// else throws std::invalid_argument so typos fail at startup.
Quota ParseQuota(const std::string& name);
const char* QuotaName(Quota quota);

// Identity behind a validated API key. The raw key is never retained.
struct Principal {
  std::string key_hash;  // SHA-256 hex of the key.
  std::string display_name;
  Quota quota{Quota::kUnlimited};
  bool enabled{true};
};

// Bearer-token authentication against a fixed key table.
//
// Keys are registered at startup and the table is read-only afterwards, so
// Authenticate() may run concurrently from every worker without locking.
class ApiKeyAuth {
 public:
  // Registers (or replaces) the principal for `key`.
  void AddKey(const std::string& key, const std::string& display_name,
              Quota quota = Quota::kUnlimited, bool enabled = true);

  // Returns the principal owning `credential`. Throws
  // GatewayError(kUnauthorized) when the credential is empty, unknown or
  // belongs to a disabled key. Digests are compared in constant time.
  Principal Authenticate(const std::string& credential) const;

  bool HasKeys() const { return !principals_.empty(); }
  std::size_t Size() const { return principals_.size(); }

  static std::string HashKey(const std::string& key);

  // Extracts the token from an "Authorization" header value of the form
  // "Bearer <token>" (scheme is case-insensitive). Returns an empty string
  // for a missing header, another scheme or an empty token.
  static std::string ExtractBearerToken(const std::string& header_value);

 private:
  std::vector<Principal> principals_;
};

}  // namespace modelgate
