#include "cli-utils.hpp"

#include "base-include.hpp"
#include "string-utils.hpp"

#include <charconv>
#include <stdexcept>

namespace tether::cli
{
// Advances `i` to the value of option `argv[i]`
static std::string_view next_arg(int argc, char** argv, int& i, std::string_view what)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   const std::string_view option = argv[i++];
   if(i >= argc)
      throw std::runtime_error(fmt::format("expected {} after argument '{}'", what, option));
   return argv[i];
}

// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief The value of option `argv[i]`, i.e., `argv[i + 1]`.
 *
 * ~~~~~~~~~~~~~{.cpp}
 * for(int i = 1; i < argc; ++i) {
 *    const std::string_view arg = argv[i];
 *    if(arg == "--uri") config.uri = cli::safe_arg_str(argc, argv, i);
 * }
 * ~~~~~~~~~~~~~
 *
 * Preconditions:
 * + `i >= 0` and `i < argc`
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i)
{
   return std::string{next_arg(argc, argv, i, "string")};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief As `safe_arg_str`, and the whole value must be a (possibly negative)
 *        integer that fits an `int`.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or the value is not an integer.
 */
int safe_arg_int(int argc, char** argv, int& i)
{
   const auto value = next_arg(argc, argv, i, "integer");
   int out          = 0;
   const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
   if(value.empty() or ec != std::errc{} or end != value.data() + value.size())
      throw std::runtime_error(
          fmt::format("expected integer after argument '{}', got '{}'", argv[i - 1], value));
   return out;
}

// ------------------------------------------------------------- parse-header-arg
/**
 * @ingroup cli
 * @brief `"Authorization: Bearer abc"` becomes `{"Authorization", "Bearer abc"}`.
 *        Only the first ':' splits; whitespace around the name and the value is
 *        dropped.
 *
 * Exceptions
 * + `std::runtime_error` if there is no ':' or the name is empty.
 */
std::pair<std::string, std::string> parse_header_arg(std::string_view arg)
{
   const auto pos = arg.find(':');
   if(pos == std::string_view::npos)
      throw std::runtime_error(fmt::format("expected 'Name: value' header, got '{}'", arg));

   auto name = trim_copy(arg.substr(0, pos));
   if(name.empty()) throw std::runtime_error(fmt::format("header name is empty in '{}'", arg));

   return {std::move(name), trim_copy(arg.substr(pos + 1))};
}

} // namespace tether::cli
