#include "gateway/dispatcher.h"

#include "gateway/errors.h"
#include "server/logging/logger.h"

namespace modelgate {

const char* RelayModeName(RelayMode mode) {
  return mode == RelayMode::kStreaming ? "streaming" : "buffered";
}

Route Dispatcher::Dispatch(const InboundRequest& request,
                           const Principal& principal) const {
  const ModelEntry* entry = registry_->Find(request.model);
  if (!entry) {
    log::Warn("dispatch", "model not found",
              "requested_model=" + request.model +
                  " key_name=" + principal.display_name);
    throw GatewayError(ErrorKind::kUnknownModel,
                       "The model '" + request.model + "' does not exist");
  }
  Route route;
  route.backend = entry;
  route.mode = request.stream ? RelayMode::kStreaming : RelayMode::kBuffered;
  log::Debug("dispatch", "routed request",
             "model=" + entry->name + " mode=" + RelayModeName(route.mode));
  return route;
}

}  // namespace modelgate
