
#pragma once

/**
 * @defgroup rpc Remote Procedure Calls
 * @ingroup tether
 *
 * A client multiplexes concurrent calls over one connection; a server dispatches
 * "Service.Method" requests to registered services and writes back the replies.
 */

#include "rpc/binary-codec.hpp"
#include "rpc/call.hpp"
#include "rpc/client.hpp"
#include "rpc/codec.hpp"
#include "rpc/handshake.hpp"
#include "rpc/header.hpp"
#include "rpc/payload.hpp"
#include "rpc/server.hpp"
#include "rpc/service.hpp"
#include "rpc/status.hpp"
#include "rpc/value.hpp"
