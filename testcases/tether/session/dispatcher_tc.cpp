#include "tether/session/dispatcher.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace tether::session::tests {

static RequestEnvelope make_request(string id, string payload) {
  return RequestEnvelope{.request_id = std::move(id), .request_payload = std::move(payload)};
}

static string throw_runtime_error(std::string_view) { throw std::runtime_error{"boom"}; }

static string throw_int(std::string_view) { throw 42; }

// Counts resolutions, and hands out a fresh target each time
class CountingResolver final : public TargetResolver {
public:
  int resolutions = 0;
  bool throw_on_resolve = false;
  bool throw_int_on_resolve = false;

  shared_ptr<Invokable> resolve(std::string_view id) override {
    ++resolutions;
    if (throw_on_resolve)
      throw std::runtime_error{"resolver is broken"};
    if (throw_int_on_resolve)
      throw 7;
    if (id != "counter")
      return nullptr;
    return make_shared<FunctionTarget>(
        [n = resolutions](std::string_view) { return format("resolution-{}", n); });
  }
};

CATCH_TEST_CASE("Dispatcher", "[dispatcher]") {
  auto registry = make_shared<TargetRegistry>();
  registry->add("echo", []() { return make_shared<EchoTarget>(); });
  registry->add_function("reporting", throw_runtime_error, true);
  registry->add_function("silent", throw_runtime_error, false);

  CATCH_SECTION("success") {
    const Dispatcher dispatcher{registry};
    const auto response = dispatcher.invoke(make_request("r-1", "hello"), "echo");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->is_success());
    CATCH_REQUIRE(response->original_request_id == "r-1");
    CATCH_REQUIRE(response->type == k_success_type);
    CATCH_REQUIRE(std::get<SuccessBody>(response->body).response_payload == "hello");
  }

  CATCH_SECTION("unknown-target-escalates") {
    for (auto policy : {FailurePolicy::RESPECT_TARGET, FailurePolicy::ALWAYS_RESPOND,
                        FailurePolicy::ALWAYS_ESCALATE}) {
      const Dispatcher dispatcher{registry, policy};
      const auto response = dispatcher.invoke(make_request("r-1", "x"), "no-such-target");
      CATCH_REQUIRE(!response.has_value());
      CATCH_REQUIRE(response.error() == make_error_code(ecode::invocation_failure));
    }
  }

  CATCH_SECTION("throwing-resolver-escalates") {
    auto resolver = make_shared<CountingResolver>();
    resolver->throw_on_resolve = true;
    const Dispatcher dispatcher{resolver, FailurePolicy::ALWAYS_RESPOND};
    const auto response = dispatcher.invoke(make_request("r-1", "x"), "counter");
    CATCH_REQUIRE(response.error() == make_error_code(ecode::invocation_failure));
  }

  CATCH_SECTION("resolver-throwing-non-exception-escalates") {
    auto resolver = make_shared<CountingResolver>();
    resolver->throw_int_on_resolve = true;
    const Dispatcher dispatcher{resolver, FailurePolicy::ALWAYS_RESPOND};
    const auto response = dispatcher.invoke(make_request("r-1", "x"), "counter");
    CATCH_REQUIRE(response.error() == make_error_code(ecode::invocation_failure));
  }

  CATCH_SECTION("target-throwing-non-exception") {
    registry->add_function("reporting-int", throw_int, true);
    registry->add_function("silent-int", throw_int, false);
    const Dispatcher dispatcher{registry};

    const auto reported = dispatcher.invoke(make_request("r-7", "x"), "reporting-int");
    CATCH_REQUIRE(reported.has_value());
    CATCH_REQUIRE(!reported->is_success());
    CATCH_REQUIRE(std::get<FailureBody>(reported->body).error_message == "unknown exception");

    const auto escalated = dispatcher.invoke(make_request("r-8", "x"), "silent-int");
    CATCH_REQUIRE(escalated.error() == make_error_code(ecode::invocation_failure));
  }

  CATCH_SECTION("respect-target") {
    const Dispatcher dispatcher{registry};
    CATCH_REQUIRE(dispatcher.policy() == FailurePolicy::RESPECT_TARGET);

    const auto reported = dispatcher.invoke(make_request("r-2", "x"), "reporting");
    CATCH_REQUIRE(reported.has_value());
    CATCH_REQUIRE(!reported->is_success());
    CATCH_REQUIRE(reported->type == k_failure_type);
    CATCH_REQUIRE(reported->original_request_id == "r-2");
    const auto& failure = std::get<FailureBody>(reported->body);
    CATCH_REQUIRE(failure.error_code == "500");
    CATCH_REQUIRE(failure.error_message == "boom");

    const auto escalated = dispatcher.invoke(make_request("r-3", "x"), "silent");
    CATCH_REQUIRE(!escalated.has_value());
    CATCH_REQUIRE(escalated.error() == make_error_code(ecode::invocation_failure));
  }

  CATCH_SECTION("always-respond") {
    const Dispatcher dispatcher{registry, FailurePolicy::ALWAYS_RESPOND};
    const auto response = dispatcher.invoke(make_request("r-4", "x"), "silent");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(std::get<FailureBody>(response->body).error_message == "boom");
  }

  CATCH_SECTION("always-escalate") {
    const Dispatcher dispatcher{registry, FailurePolicy::ALWAYS_ESCALATE};
    const auto response = dispatcher.invoke(make_request("r-5", "x"), "reporting");
    CATCH_REQUIRE(response.error() == make_error_code(ecode::invocation_failure));
    CATCH_REQUIRE(dispatcher.invoke(make_request("r-6", "y"), "echo").has_value());
  }

  CATCH_SECTION("resolved-for-every-request") {
    auto resolver = make_shared<CountingResolver>();
    const Dispatcher dispatcher{resolver};
    const auto first = dispatcher.invoke(make_request("r-1", ""), "counter");
    const auto second = dispatcher.invoke(make_request("r-2", ""), "counter");
    CATCH_REQUIRE(resolver->resolutions == 2);
    CATCH_REQUIRE(std::get<SuccessBody>(first->body).response_payload == "resolution-1");
    CATCH_REQUIRE(std::get<SuccessBody>(second->body).response_payload == "resolution-2");
  }

  CATCH_SECTION("null-resolver") {
    CATCH_REQUIRE_THROWS_AS(Dispatcher{nullptr}, std::invalid_argument);
  }
}

CATCH_TEST_CASE("FailurePolicy", "[dispatcher]") {
  CATCH_REQUIRE(parse_failure_policy("respect-target") == FailurePolicy::RESPECT_TARGET);
  CATCH_REQUIRE(parse_failure_policy("always-respond") == FailurePolicy::ALWAYS_RESPOND);
  CATCH_REQUIRE(parse_failure_policy("always-escalate") == FailurePolicy::ALWAYS_ESCALATE);
  CATCH_REQUIRE(!parse_failure_policy("Always-Respond").has_value());
  CATCH_REQUIRE(!parse_failure_policy("").has_value());
}

CATCH_TEST_CASE("TargetRegistry", "[dispatcher]") {
  TargetRegistry registry;
  CATCH_REQUIRE(!registry.contains("echo"));
  CATCH_REQUIRE(registry.resolve("echo") == nullptr);

  registry.add("echo", []() { return make_shared<EchoTarget>(); });
  CATCH_REQUIRE(registry.contains("echo"));
  const auto first = registry.resolve("echo");
  const auto second = registry.resolve("echo");
  CATCH_REQUIRE(first != nullptr);
  CATCH_REQUIRE(first != second);
  CATCH_REQUIRE(first->call("payload") == "payload");

  CATCH_REQUIRE_THROWS_AS(registry.add("empty", TargetRegistry::factory_type{}),
                          std::invalid_argument);
  CATCH_REQUIRE(!registry.contains("empty"));
}

} // namespace tether::session::tests
