#include "tether/utils.hpp"

#include <catch2/catch.hpp>

namespace tether::tests {

CATCH_TEST_CASE("ErrorCodes", "[error-codes]") {
  CATCH_SECTION("category") {
    const error_code ec = ecode::handshake_failure;
    CATCH_REQUIRE(ec);
    CATCH_REQUIRE(string{ec.category().name()} == "tether");
    CATCH_REQUIRE(ec.message() == "handshake failure");
    CATCH_REQUIRE(ec == make_error_code(ecode::handshake_failure));
    CATCH_REQUIRE(ec != make_error_code(ecode::interrupted_connect));
    CATCH_REQUIRE(!make_error_code(ecode::okay));
  }

  CATCH_SECTION("session-error") {
    try {
      throw SessionError{ecode::trust_material_error, "no such file"};
    } catch (const std::system_error& e) {
      CATCH_REQUIRE(e.code() == make_error_code(ecode::trust_material_error));
      CATCH_REQUIRE(string{e.what()}.find("no such file") != string::npos);
    }
  }

  CATCH_SECTION("file-get-contents") {
    string out = "stale";
    const auto ec = file_get_contents("/this/path/does/not/exist", out);
    CATCH_REQUIRE(ec == std::errc::no_such_file_or_directory);
  }

  CATCH_SECTION("join-path") {
    CATCH_REQUIRE(join_path("a", "b.so") == "a/b.so");
    CATCH_REQUIRE(join_path("a/", "b.so") == "a/b.so");
    CATCH_REQUIRE(join_path("", "b.so") == "b.so");
  }
}

} // namespace tether::tests
