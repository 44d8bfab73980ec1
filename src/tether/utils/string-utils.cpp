#include "string-utils.hpp"

#include <algorithm>

namespace tether {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)); }

std::string_view trim(std::string_view s) {
  const auto first = std::find_if_not(cbegin(s), cend(s), is_space);
  const auto last = std::find_if_not(s.crbegin(), s.crend(), is_space).base();
  return (first < last) ? s.substr(std::size_t(first - cbegin(s)), std::size_t(last - first))
                        : std::string_view{};
}

string hexdump(std::span<const std::byte> data) {
  constexpr std::size_t k_row_bytes = 16;
  constexpr std::size_t k_ascii_column = 51;

  string out;
  out.reserve((data.size() / k_row_bytes + 1) * (k_ascii_column + k_row_bytes + 1));

  for (std::size_t offset = 0; offset < data.size(); offset += k_row_bytes) {
    const auto row = data.subspan(offset, std::min(k_row_bytes, data.size() - offset));

    string line = format("{:08x}:", offset);
    for (std::size_t i = 0; i < row.size(); ++i) {
      if (i % 2 == 0)
        line += ' ';
      line += format("{:02x}", std::to_integer<unsigned>(row[i]));
    }

    line.resize(k_ascii_column, ' ');
    for (const auto byte : row) {
      const auto c = std::to_integer<unsigned char>(byte);
      line += std::isprint(c) ? char(c) : '.';
    }
    line.resize(k_ascii_column + k_row_bytes, ' ');

    out += line;
    out += '\n';
  }

  return out;
}

string elide(std::string_view s, std::size_t max_size) {
  if (s.size() <= max_size)
    return string{s};
  return format("{}... ({} bytes)", s.substr(0, max_size), s.size());
}

} // namespace tether
