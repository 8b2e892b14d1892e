#pragma once

/// Umbrella header for the mcp_echo server library.

#include "version.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "session.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "tools/echo_tool.hpp"
#include "message_loop.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/stream_transport.hpp"
#include "transport/framed_reader.hpp"
#include "transport/framed_writer.hpp"
