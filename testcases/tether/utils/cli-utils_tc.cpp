#include "tether/utils/cli-utils.hpp"

#include "tether/utils.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

namespace tether::cli::tests {

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("cli-utils") {
    std::vector<std::string> args = {"exec-name", "1", "two", "three"};
    std::vector<char*> argv_s;
    int argc = int(args.size());
    for (auto i = 0; i < argc; ++i)
      argv_s.push_back(args[i].data());
    char** argv = argv_s.data();

    {
      int i = 0;
      CATCH_REQUIRE(safe_arg_int(argc, argv, i) == 1);
      CATCH_REQUIRE(i == 1);
      CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "two");
      CATCH_REQUIRE(i == 2);
      CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "three");
      CATCH_REQUIRE(i == 3);
    }

    { // Running off the end
      int i = 3;
      CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
    }

    { // "two" is not an integer
      int i = 1;
      CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i), std::runtime_error);
    }
  }

  CATCH_SECTION("empty-integer") {
    std::vector<std::string> args = {"exec-name", "--duration", ""};
    std::vector<char*> argv_s;
    for (auto& arg : args)
      argv_s.push_back(arg.data());
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(int(argv_s.size()), argv_s.data(), i),
                            std::runtime_error);
  }

  CATCH_SECTION("parse-header-arg") {
    {
      const auto [name, value] = parse_header_arg("Authorization: Bearer abc");
      CATCH_REQUIRE(name == "Authorization");
      CATCH_REQUIRE(value == "Bearer abc");
    }

    { // Only the first ':' splits
      const auto [name, value] = parse_header_arg("  X-Origin :https://a.example:8443  ");
      CATCH_REQUIRE(name == "X-Origin");
      CATCH_REQUIRE(value == "https://a.example:8443");
    }

    {
      const auto [name, value] = parse_header_arg("X-Empty:");
      CATCH_REQUIRE(name == "X-Empty");
      CATCH_REQUIRE(value.empty());
    }

    CATCH_REQUIRE_THROWS_AS(parse_header_arg("no-colon"), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(parse_header_arg(" : value"), std::runtime_error);
  }
}

} // namespace tether::cli::tests
