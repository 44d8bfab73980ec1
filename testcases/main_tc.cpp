#include "tether/utils.hpp"

#include "support/relay-stub.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <catch2/catch.hpp>

#include <future>
#include <initializer_list>

namespace tether {
int main(int argc, char** argv);
}

namespace tether::tests {

using test::RelayStub;

static int run_main(std::initializer_list<std::string_view> arguments) {
  vector<string> args = {"tether-debug"};
  for (auto arg : arguments)
    args.emplace_back(arg);
  vector<char*> argv;
  for (auto& arg : args)
    argv.push_back(arg.data());
  argv.push_back(nullptr);
  return tether::main(int(args.size()), argv.data());
}

static uint16_t unused_port() {
  boost::asio::io_context io_context;
  boost::asio::ip::tcp::acceptor acceptor{io_context,
                                          {boost::asio::ip::make_address("127.0.0.1"), 0}};
  return acceptor.local_endpoint().port();
}

CATCH_TEST_CASE("tether-debug", "[main]") {
  CATCH_SECTION("help") { CATCH_REQUIRE(run_main({"--help"}) == EXIT_SUCCESS); }

  CATCH_SECTION("usage-errors") {
    CATCH_REQUIRE(run_main({"--bogus"}) == 2);
    CATCH_REQUIRE(run_main({"--uri"}) == 2);
    CATCH_REQUIRE(run_main({"--uri", "wss://localhost/", "--duration", "ten"}) == 2);
    CATCH_REQUIRE(run_main({"--uri", "wss://localhost/", "--echo", "--target", "x"}) == 2);
    CATCH_REQUIRE(run_main({"--uri", "wss://localhost:", "--echo"}) == 2);
    CATCH_REQUIRE(run_main({"--uri", "wss://localhost/"}) == 2); // no target
    CATCH_REQUIRE(run_main({"--uri", "wss://localhost/", "--echo", "--failure-policy", "x"}) ==
                  2);
  }

  CATCH_SECTION("session-errors") {
    const auto uri = format("wss://127.0.0.1:{}/", unused_port());
    CATCH_REQUIRE(run_main({uri, "--echo"}) == 2); // the uri needs its flag
    CATCH_REQUIRE(run_main({"--uri", uri, "--echo", "--connect-timeout", "5"}) == EXIT_FAILURE);
    CATCH_REQUIRE(run_main({"--uri", uri, "--target", "t", "--library-dir",
                            "/no/such/directory"}) == EXIT_FAILURE);
  }

  CATCH_SECTION("clean-close") {
    RelayStub stub;
    const auto uri = stub.uri("/v1/debug");
    auto exit_code = std::async(std::launch::async, [&uri]() {
      return run_main({"--uri", uri, "--echo", "--header", "Authorization: Bearer t"});
    });
    CATCH_REQUIRE(stub.wait_for_client());
    CATCH_REQUIRE(stub.request_header("Authorization") == std::optional<string>{"Bearer t"});
    stub.close(1000, "done");
    CATCH_REQUIRE(exit_code.get() == EXIT_SUCCESS);
  }
}

} // namespace tether::tests
