
#pragma once

#include <string>
#include <string_view>
#include <utility>

/**
 * @defgroup cli Command Line Utils
 * @ingroup tether-utils
 *
 * The `tether` method for parsing command-line arguments.
 */

namespace tether::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);

// ---------------------------------------------------------------- parse header

/**
 * @brief Split a `"Name: value"` argument into its name and value.
 */
std::pair<std::string, std::string> parse_header_arg(std::string_view arg);

} // namespace tether::cli
