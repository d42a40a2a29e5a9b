
#pragma once

/**
 * @defgroup net Networking
 * @ingroup tether
 *
 * Blocking byte streams (tcp and unix-domain sockets) built on boost::asio.
 */

#include "net/buffer.hpp"
#include "net/buffered-reader.hpp"
#include "net/connection.hpp"
#include "net/listener.hpp"
