#pragma once

#include "config.hpp"
#include "session.hpp"

#include <istream>
#include <ostream>

namespace termctl::mcp {

    // Reads one request per line from `in` and writes exactly one response
    // line per request to `out`, flushing after each. Returns 0 at end of
    // input, 1 if the output stream fails.
    int serve(std::istream& in, std::ostream& out, session& server);

    // stdio server over the system gateway
    int run_mcp_server(const startup_config& cfg);

}  // namespace termctl::mcp
