#include "tether/session.hpp"
#include "tether/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <stdexcept>
#include <thread>

namespace tether {

static constexpr int k_exit_session_error = EXIT_FAILURE;
static constexpr int k_exit_usage_error = 2;

static void show_help(const char* exec) {
  fmt::print(R"V0G0N(

   Usage: {} --uri wss://host[:port][/path] (--target NAME [--library-dir DIR] | --echo) [OPTIONS...]

      Opens one debug session to a debugging relay, and answers each request it forwards
      by invoking a local target.

   Target:

      --target NAME          Invoke `<DIR>/libNAME.so`, reloaded for every request.
      --library-dir DIR      Directory holding the target library. Default is '.'.
      --echo                 Answer every request with its own payload.
      --failure-policy P     One of 'respect-target' (default), 'always-respond',
                             'always-escalate'.

   Connection:

      --header "Name: value" Add a header to the upgrade request. May be repeated.
      --duration SECONDS     End the session after SECONDS. Default is 3600.
      --connect-timeout S    Timeout, in seconds, for each connect stage. Default is 30.

   Trust:

      --trust-all            Accept any server certificate. (The default.)
      --ca-file FILE         Verify the server against the authorities in FILE.
      --system-ca            Verify the server against the system certificate store.
      --cert-file FILE       Client certificate chain to present.
      --key-file FILE        Private key for --cert-file.
      --key-password PASS    Password for an encrypted --key-file.

   Logging:

      --log-level LEVEL      One of trace, debug, info, warn, err, critical, off.
                             Overrides the LOG_LEVEL_OVERRIDE environment variable.

   Exit status is 0 when the session closes cleanly, 1 when it fails, and 2 on a
   usage error.

)V0G0N",
             exec);
}

struct Arguments {
  session::SessionConfig config = {};
  string library_dir = ".";
  bool echo = false;
  bool show_help = false;
};

static Arguments parse_arguments(int argc, char** argv) {
  Arguments args;
  auto& config = args.config;
  auto& trust = config.trust;
  bool trust_all = false;

  for (int i = 1; i < argc; ++i) {
    const string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "--uri") {
      config.uri = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--header") {
      config.headers.push_back(cli::parse_header_arg(cli::safe_arg_str(argc, argv, i)));
    } else if (arg == "--target") {
      config.target_id = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--library-dir") {
      args.library_dir = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--echo") {
      args.echo = true;
    } else if (arg == "--failure-policy") {
      const auto value = cli::safe_arg_str(argc, argv, i);
      const auto policy = session::parse_failure_policy(value);
      if (!policy)
        throw std::runtime_error{format("unknown failure policy '{}'", value)};
      config.failure_policy = *policy;
    } else if (arg == "--duration") {
      config.duration = std::chrono::seconds{cli::safe_arg_int(argc, argv, i)};
    } else if (arg == "--connect-timeout") {
      config.connect_timeout = std::chrono::seconds{cli::safe_arg_int(argc, argv, i)};
    } else if (arg == "--trust-all") {
      trust_all = true;
    } else if (arg == "--ca-file") {
      trust.ca_file = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--system-ca") {
      trust.use_system_ca = true;
    } else if (arg == "--cert-file") {
      trust.certificate_file = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--key-file") {
      trust.private_key_file = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--key-password") {
      trust.private_key_password = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--log-level") {
      const auto level = cli::safe_arg_str(argc, argv, i);
      if (!logging::set_log_level(level))
        throw std::runtime_error{format("unknown log level '{}'", level)};
    } else {
      throw std::runtime_error{format("unexpected argument '{}'", arg)};
    }
  }

  const bool fixed = !trust.ca_file.empty() || trust.use_system_ca ||
                     !trust.certificate_file.empty() || !trust.private_key_file.empty();
  if (trust_all && fixed)
    throw std::runtime_error{"--trust-all cannot be combined with certificate options"};
  trust.mode = fixed ? trust::TrustSelector::Mode::FIXED : trust::TrustSelector::Mode::TRUST_ALL;

  if (args.echo) {
    if (!config.target_id.empty())
      throw std::runtime_error{"--echo cannot be combined with --target"};
    config.target_id = "echo";
  }

  return args;
}

static shared_ptr<session::TargetResolver> make_resolver(const Arguments& args) {
  if (args.echo) {
    auto registry = make_shared<session::TargetRegistry>();
    registry->add("echo", []() { return make_shared<session::EchoTarget>(); });
    return registry;
  }
  if (!is_directory(args.library_dir))
    throw SessionError{ecode::invalid_configuration,
                       format("library directory '{}' not found", args.library_dir)};
  return make_shared<session::SharedLibraryResolver>(args.library_dir);
}

int main(int argc, char** argv) {
  Arguments args;
  try {
    args = parse_arguments(argc, argv);
  } catch (std::exception& e) {
    fmt::print(stderr, "{}\n", e.what());
    fmt::print(stderr, "Type '{} --help' for usage\n", argv[0]);
    return k_exit_usage_error;
  }

  if (args.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  if (const auto message = session::validate(args.config)) {
    fmt::print(stderr, "{}\n", *message);
    fmt::print(stderr, "Type '{} --help' for usage\n", argv[0]);
    return k_exit_usage_error;
  }

  try {
    session::DebugSession debug_session{args.config, make_resolver(args)};

    // Ctrl-C ends the session, including a connect in progress
    boost::asio::io_context signal_context{1};
    boost::asio::signal_set signals{signal_context, SIGINT, SIGTERM};
    signals.async_wait([&debug_session](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        INFO("received signal {}, stopping the debug session", signal_number);
        debug_session.stop();
      }
    });
    std::thread signal_thread{[&signal_context]() { signal_context.run(); }};

    const auto finish = [&]() {
      signal_context.stop();
      signal_thread.join();
    };

    try {
      debug_session.start();
    } catch (...) {
      finish();
      throw;
    }

    const auto ec = debug_session.wait();
    finish();

    if (ec) {
      LOG_ERR("debug session failed: {}", ec.message());
      return k_exit_session_error;
    }
  } catch (SessionError& e) {
    LOG_ERR("{}", e.what());
    return k_exit_session_error;
  } catch (std::exception& e) {
    LOG_ERR("unexpected error: {}", e.what());
    return k_exit_session_error;
  }

  return EXIT_SUCCESS;
}

} // namespace tether

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return tether::main(argc, argv); }

#endif
