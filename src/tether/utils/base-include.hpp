#pragma once

// Turn on 64bit files, stdio.h
#define _FILE_OFFSET_BITS 64

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__

// Contrib
#include <fmt/format.h>
#include <ofats/invocable.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/concepts.hpp>
#include <tl/expected.hpp>

#include "base/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tether {

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

using fmt::format;

using ofats::any_invocable;
using std::function;

using std::string;
using std::string_view;
using std::vector;

using std::make_shared;
using std::make_unique;
using std::shared_ptr;
using std::unique_ptr;

using std::cbegin;
using std::cend;

using std::error_code;

// 1s is 1 second, 30ms is 30 milliseconds
using namespace std::literals::chrono_literals;

} // namespace tether
