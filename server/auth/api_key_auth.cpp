#include "server/auth/api_key_auth.h"

#include "gateway/errors.h"
#include "server/logging/logger.h"

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace modelgate {

Quota ParseQuota(const std::string& name) {
  if (name.empty() || name == "unlimited") {
    return Quota::kUnlimited;
  }
  throw std::invalid_argument("unsupported quota '" + name + "'");
}

const char* QuotaName(Quota quota) {
  switch (quota) {
    case Quota::kUnlimited:
      return "unlimited";
  }
  return "unlimited";
}

std::string ApiKeyAuth::HashKey(const std::string& key) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string ApiKeyAuth::ExtractBearerToken(const std::string& header_value) {
  auto start = header_value.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return {};
  }
  static const std::string kScheme = "bearer";
  if (header_value.size() < start + kScheme.size()) {
    return {};
  }
  for (std::size_t i = 0; i < kScheme.size(); ++i) {
    char c = static_cast<char>(
        std::tolower(static_cast<unsigned char>(header_value[start + i])));
    if (c != kScheme[i]) {
      return {};
    }
  }
  std::size_t pos = start + kScheme.size();
  if (pos >= header_value.size() ||
      (header_value[pos] != ' ' && header_value[pos] != '\t')) {
    return {};
  }
  auto token_start = header_value.find_first_not_of(" \t", pos);
  if (token_start == std::string::npos) {
    return {};
  }
  auto token_end = header_value.find_last_not_of(" \t\r\n");
  std::string token =
      header_value.substr(token_start, token_end - token_start + 1);
  // A token never contains whitespace; "Bearer a b" is malformed.
  if (token.find_first_of(" \t") != std::string::npos) {
    return {};
  }
  return token;
}

void ApiKeyAuth::AddKey(const std::string& key, const std::string& display_name,
                        Quota quota, bool enabled) {
  if (key.empty()) {
    throw std::invalid_argument("API key must not be empty");
  }
  Principal principal;
  principal.key_hash = HashKey(key);
  principal.display_name = display_name;
  principal.quota = quota;
  principal.enabled = enabled;
  auto it = std::find_if(principals_.begin(), principals_.end(),
                         [&](const Principal& p) {
                           return p.key_hash == principal.key_hash;
                         });
  if (it != principals_.end()) {
    *it = std::move(principal);
  } else {
    principals_.push_back(std::move(principal));
  }
}

Principal ApiKeyAuth::Authenticate(const std::string& credential) const {
  if (credential.empty()) {
    log::Warn("auth", "authentication failed", "reason=missing_credential");
    throw GatewayError(ErrorKind::kUnauthorized,
                       "Missing bearer token in Authorization header");
  }
  const std::string digest = HashKey(credential);
  // Scan every entry so the time spent does not depend on which one matches.
  const Principal* match = nullptr;
  for (const auto& principal : principals_) {
    if (CRYPTO_memcmp(principal.key_hash.data(), digest.data(),
                      digest.size()) == 0) {
      match = &principal;
    }
  }
  if (!match) {
    log::Warn("auth", "authentication failed", "reason=unknown_key");
    throw GatewayError(ErrorKind::kUnauthorized, "Invalid API key");
  }
  if (!match->enabled) {
    log::Warn("auth", "authentication failed",
              "reason=key_disabled key_name=" + match->display_name);
    throw GatewayError(ErrorKind::kUnauthorized, "API key is disabled");
  }
  log::Debug("auth", "authentication succeeded",
             "key_name=" + match->display_name);
  return *match;
}

}  // namespace modelgate
