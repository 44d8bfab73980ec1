#pragma once

/**
 * @defgroup session Debug Session
 * @ingroup tether
 */

#include "session/debug-session.hpp"
#include "session/dispatcher.hpp"
#include "session/envelope-codec.hpp"
#include "session/invocation-target.hpp"
#include "session/session-config.hpp"
#include "session/session-controller.hpp"
#include "session/shared-library-resolver.hpp"
