#include "tether/utils/string-utils.hpp"

#include <catch2/catch.hpp>

namespace tether::tests {

CATCH_TEST_CASE("StrUtils", "[str-utils]") {
  CATCH_SECTION("to-lower") {
    CATCH_REQUIRE(to_lower_copy(string{"WSS://Relay.Example"}) == "wss://relay.example");
    CATCH_REQUIRE(to_lower_copy(string{}) == "");
  }

  CATCH_SECTION("trim") {
    CATCH_REQUIRE(trim_copy("  a b \t\n") == "a b");
    CATCH_REQUIRE(trim_copy("   ") == "");
    CATCH_REQUIRE(trim("\tx") == "x");
    CATCH_REQUIRE(trim("x ") == "x");
    CATCH_REQUIRE(trim("") == "");
  }

  CATCH_SECTION("elide") {
    CATCH_REQUIRE(elide("short", 10) == "short");
    CATCH_REQUIRE(elide("0123456789abc", 10) == "0123456789... (13 bytes)");
  }

  CATCH_SECTION("hexdump") {
    const string text = "{\"type\":\"SkillRe";
    const auto dump = hexdump(
        std::span<const std::byte>{reinterpret_cast<const std::byte*>(text.data()), text.size()});
    CATCH_REQUIRE(dump ==
                  "00000000: 7b22 7479 7065 223a 2253 6b69 6c6c 5265  {\"type\":\"SkillRe\n");

    const string binary = {'\x00', '\x01', '\xff'};
    const auto short_dump = hexdump(std::span<const std::byte>{
        reinterpret_cast<const std::byte*>(binary.data()), binary.size()});
    CATCH_REQUIRE(short_dump.size() == 68);
    CATCH_REQUIRE(short_dump.substr(0, 17) == "00000000: 0001 ff");
    CATCH_REQUIRE(short_dump.substr(51, 3) == "...");
  }
}

} // namespace tether::tests
