#include "gateway/model_registry.h"

#include "gateway/errors.h"

#include <algorithm>
#include <stdexcept>

namespace modelgate {

ModelRegistry::ModelRegistry(std::vector<ModelEntry> entries) {
  for (auto &entry : entries) {
    if (entry.name.empty()) {
      throw std::invalid_argument("model entry without a name");
    }
    if (entry.host.empty()) {
      throw std::invalid_argument("model '" + entry.name + "' has no host");
    }
    if (entry.port <= 0 || entry.port > 65535) {
      throw std::invalid_argument("model '" + entry.name +
                                  "' has invalid port " +
                                  std::to_string(entry.port));
    }
    std::string name = entry.name;
    if (!entries_.emplace(name, std::move(entry)).second) {
      throw std::invalid_argument("duplicate model name '" + name + "'");
    }
  }
}

const ModelEntry &ModelRegistry::Resolve(const std::string &name) const {
  auto it = entries_.find(name);
  if (it == entries_.end()) {
    throw GatewayError(ErrorKind::kUnknownModel,
                       "The model '" + name + "' does not exist");
  }
  return it->second;
}

const ModelEntry *ModelRegistry::Find(const std::string &name) const {
  auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> ModelRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto &[name, entry] : entries_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace modelgate
