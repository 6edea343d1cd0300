#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

// ── Registry entry ──────────────────────────────────────────────────────────
// One backend endpoint serving one public model name.
struct ModelEntry {
  std::string name;           // Public model ID clients put in "model".
  std::string host{"localhost"};
  int port{0};
  std::optional<std::string> default_quant;  // Informational, e.g. "Q4_K_M".
  std::string backend_model;  // Model tag sent upstream; empty means `name`.

  std::chrono::seconds request_timeout{30};  // Buffered-mode total deadline.
  std::chrono::seconds idle_timeout{60};     // Streaming gap between chunks.
  std::chrono::seconds connect_timeout{5};

  const std::string &UpstreamModel() const {
    return backend_model.empty() ? name : backend_model;
  }
};

// ── ModelRegistry ────────────────────────────────────────────────────────────
// Immutable name → backend lookup table built once at startup.
//
// Lifecycle:
//   ModelRegistry registry(config.models);   // throws on invalid input
//   const ModelEntry& entry = registry.Resolve("llama3");
//
// Thread safety: nothing mutates the table after construction, so concurrent
// readers need no synchronisation. A future reload should build a new
// registry and swap the whole object, never edit this one in place.
class ModelRegistry {
public:
  ModelRegistry() = default;

  // Throws std::invalid_argument on an empty name, a duplicate name, an
  // empty host or a port outside 1..65535.
  explicit ModelRegistry(std::vector<ModelEntry> entries);

  // Exact, case-sensitive match. Throws GatewayError(kUnknownModel).
  const ModelEntry &Resolve(const std::string &name) const;

  // Non-throwing variant; nullptr when not configured.
  const ModelEntry *Find(const std::string &name) const;

  // Configured names in ascending order.
  std::vector<std::string> Names() const;

  std::size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }

private:
  std::unordered_map<std::string, ModelEntry> entries_;
};

} // namespace modelgate
