
#pragma once

/**
 * @defgroup async Async
 * @ingroup tether
 */

#include "async/completion-queue.hpp"
#include "async/execution-context.hpp"
#include "async/wait-group.hpp"
