#pragma once

/// Umbrella header for the simplemcp MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "framer.hpp"
#include "schema.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "session.hpp"
#include "dispatcher.hpp"
#include "server.hpp"
#include "config.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
