#pragma once

#include "error-codes.hpp"

#include <string>
#include <string_view>

namespace tether
{
// ------------------------------------------------------------ file-get-contents

error_code file_get_contents(const std::string_view fname, std::string& out);

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename);
bool is_directory(const std::string_view filename);

// ---------------------------------------------------------------- join-path

std::string join_path(const std::string_view directory, const std::string_view filename);

} // namespace tether
