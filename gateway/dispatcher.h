#pragma once

#include "gateway/chat_request.h"
#include "gateway/model_registry.h"
#include "server/auth/api_key_auth.h"

namespace modelgate {

enum class RelayMode { kBuffered, kStreaming };

const char* RelayModeName(RelayMode mode);

struct Route {
  const ModelEntry* backend{nullptr};
  RelayMode mode{RelayMode::kBuffered};
};

// Pure routing decision: picks the backend for request.model and the relay
// mode from request.stream. Performs no I/O.
class Dispatcher {
 public:
  explicit Dispatcher(const ModelRegistry* registry) : registry_(registry) {}

  // Throws GatewayError(kUnknownModel) when the model is not configured.
  Route Dispatch(const InboundRequest& request,
                 const Principal& principal) const;

 private:
  const ModelRegistry* registry_;
};

}  // namespace modelgate
