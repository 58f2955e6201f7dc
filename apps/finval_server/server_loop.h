#pragma once

#include "server_context.h"

#include <iosfwd>
#include <string>

namespace finval::server {

// handle_line processes one JSON-RPC request line and returns the response line.
[[nodiscard]] std::string handle_line(const std::string& line, ServerContext& ctx);

// run_server_loop reads one request per line from in until EOF and writes one
// response per line to out. Blank lines are skipped. Diagnostics go to std::cerr.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace finval::server
