#pragma once

/**
 * @defgroup tether Tether
 */

/**
 * @defgroup tether-utils Utilities
 * @ingroup tether
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
#include "utils/file-system.hpp"
#include "utils/string-utils.hpp"
