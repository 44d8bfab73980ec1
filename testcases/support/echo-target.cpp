#include "tether/session/target-abi.h"

#include <cstring>
#include <string_view>

// Answers "echo:<request>". Asked to "fail", it fails with a message; asked to
// "fail-silently", it fails without one.
extern "C" int tether_invoke(const char* request, size_t request_size, void* sink,
                             tether_write_fn write) {
  const std::string_view payload{request, request_size};

  if (payload == "fail") {
    constexpr std::string_view message = "echo-target was asked to fail";
    write(sink, message.data(), message.size());
    return 1;
  }

  if (payload == "fail-silently")
    return 7;

  constexpr std::string_view prefix = "echo:";
  write(sink, prefix.data(), prefix.size());
  write(sink, payload.data(), payload.size());
  return 0;
}
