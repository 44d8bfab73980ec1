#pragma once

#include "base-include.hpp"

#include <range/v3/algorithm/transform.hpp>

#include <cctype>
#include <span>
#include <string>
#include <string_view>

/**
 * @defgroup tether-strings Strings
 * @ingroup tether-utils
 */
namespace tether {

// -------------------------------------------------------------------------------------- to-lower

/**
 * @ingroup tether-strings
 * @brief ASCII lowercase of `r`, in place. Used for scheme and header-name comparisons.
 */
template <class Range>
requires ranges::range<Range> Range to_lower(Range r) {
  ranges::transform(r, ranges::begin(r), [](unsigned char c) { return char(std::tolower(c)); });
  return r;
}

template <typename string_type> string_type to_lower_copy(const string_type& s) {
  return to_lower(string_type{s});
}

// ------------------------------------------------------------------------------------------ trim

/**
 * @ingroup tether-strings
 * @brief `s` without leading and trailing whitespace.
 */
std::string_view trim(std::string_view s);

inline string trim_copy(std::string_view s) { return string{trim(s)}; }

// --------------------------------------------------------------------------------------- logging

/**
 * @ingroup tether-strings
 * @brief `xxd` style dump of binary data, for tracing binary frames.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~
 * 00000000: 7b22 7479 7065 223a 2253 6b69 6c6c 5265  {"type":"SkillRe
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
string hexdump(std::span<const std::byte> data);

/**
 * @ingroup tether-strings
 * @brief `s` if it is short, otherwise its first `max_size` characters and a marker.
 */
string elide(std::string_view s, std::size_t max_size);

} // namespace tether
