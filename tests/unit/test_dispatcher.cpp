#include <catch2/catch.hpp>

#include "gateway/dispatcher.h"
#include "gateway/errors.h"

namespace {

modelgate::ModelRegistry MakeRegistry() {
  modelgate::ModelEntry llama;
  llama.name = "llama3";
  llama.host = "10.0.0.5";
  llama.port = 11434;
  modelgate::ModelEntry mistral;
  mistral.name = "mistral";
  mistral.host = "10.0.0.6";
  mistral.port = 11434;
  return modelgate::ModelRegistry({llama, mistral});
}

modelgate::InboundRequest Request(const std::string& model, bool stream) {
  modelgate::InboundRequest req;
  req.model = model;
  req.messages.push_back({"user", "hi"});
  req.stream = stream;
  return req;
}

}  // namespace

TEST_CASE("Dispatcher routes by model name", "[dispatcher]") {
  auto registry = MakeRegistry();
  modelgate::Dispatcher dispatcher(&registry);
  modelgate::Principal principal;
  principal.display_name = "team-a";

  auto route = dispatcher.Dispatch(Request("mistral", false), principal);
  REQUIRE(route.backend == registry.Find("mistral"));
  REQUIRE(route.backend->host == "10.0.0.6");
  REQUIRE(route.mode == modelgate::RelayMode::kBuffered);
}

TEST_CASE("Dispatcher picks streaming mode from the request",
          "[dispatcher]") {
  auto registry = MakeRegistry();
  modelgate::Dispatcher dispatcher(&registry);
  auto route = dispatcher.Dispatch(Request("llama3", true), {});
  REQUIRE(route.mode == modelgate::RelayMode::kStreaming);
  REQUIRE(std::string(modelgate::RelayModeName(route.mode)) == "streaming");
}

TEST_CASE("Dispatcher rejects unknown models", "[dispatcher]") {
  auto registry = MakeRegistry();
  modelgate::Dispatcher dispatcher(&registry);
  try {
    dispatcher.Dispatch(Request("gpt-4", false), {});
    FAIL("expected unknown_model");
  } catch (const modelgate::GatewayError& e) {
    REQUIRE(e.kind() == modelgate::ErrorKind::kUnknownModel);
    REQUIRE(std::string(e.what()).find("gpt-4") != std::string::npos);
  }
}
