#include "tether/session/dispatcher.hpp"
#include "tether/session/shared-library-resolver.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace tether::session::tests {

static error_code resolve_error(SharedLibraryResolver& resolver, std::string_view id) {
  try {
    resolver.resolve(id);
  } catch (const SessionError& e) {
    return e.code();
  }
  return {};
}

CATCH_TEST_CASE("SharedLibraryResolver", "[shared-library-resolver]") {
  SharedLibraryResolver resolver{TETHER_TEST_TARGET_DIR};

  CATCH_SECTION("library-path") {
    CATCH_REQUIRE(SharedLibraryResolver::library_path("/opt/targets", "hello") ==
                  "/opt/targets/libhello.so");
    CATCH_REQUIRE(resolver.directory() == TETHER_TEST_TARGET_DIR);
  }

  CATCH_SECTION("call") {
    const auto target = resolver.resolve("echo-target");
    CATCH_REQUIRE(target != nullptr);
    CATCH_REQUIRE(target->reports_failures());
    CATCH_REQUIRE(target->call(R"({"intent":"hello"})") == R"(echo:{"intent":"hello"})");
    CATCH_REQUIRE(target->call("") == "echo:");
  }

  CATCH_SECTION("failures") {
    const auto target = resolver.resolve("echo-target");
    try {
      target->call("fail");
      CATCH_FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
      CATCH_REQUIRE(string{e.what()} == "echo-target was asked to fail");
    }

    try {
      target->call("fail-silently");
      CATCH_FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
      CATCH_REQUIRE(string{e.what()}.ends_with("libecho-target.so returned 7"));
    }
  }

  CATCH_SECTION("through-the-dispatcher") {
    const Dispatcher dispatcher{make_shared<SharedLibraryResolver>(TETHER_TEST_TARGET_DIR)};
    const auto ok = dispatcher.invoke(
        RequestEnvelope{.request_id = "r-1", .request_payload = "ping"}, "echo-target");
    CATCH_REQUIRE(ok.has_value());
    CATCH_REQUIRE(std::get<SuccessBody>(ok->body).response_payload == "echo:ping");

    const auto failed = dispatcher.invoke(
        RequestEnvelope{.request_id = "r-2", .request_payload = "fail"}, "echo-target");
    CATCH_REQUIRE(failed.has_value());
    CATCH_REQUIRE(std::get<FailureBody>(failed->body).error_message ==
                  "echo-target was asked to fail");

    const auto missing = dispatcher.invoke(
        RequestEnvelope{.request_id = "r-3", .request_payload = "ping"}, "no-such-target");
    CATCH_REQUIRE(missing.error() == make_error_code(ecode::invocation_failure));
  }

  CATCH_SECTION("missing-library") {
    CATCH_REQUIRE(resolve_error(resolver, "no-such-target") ==
                  make_error_code(ecode::invocation_failure));
  }

  CATCH_SECTION("invalid-ids") {
    for (const auto* id : {"", ".", "..", "../echo-target", "echo target", "/tmp/x"})
      CATCH_REQUIRE(resolve_error(resolver, id) == make_error_code(ecode::invocation_failure));
  }
}

} // namespace tether::session::tests
