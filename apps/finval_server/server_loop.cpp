#include "server_loop.h"

#include "method_handlers.h"
#include "rpc_protocol.h"

#include <iostream>

namespace finval::server {

std::string handle_line(const std::string& line, ServerContext& ctx) {
  static const auto method_registry = build_method_registry();

  const auto request = parse_request(line);
  if (!request.has_value()) {
    return make_error_response(nullptr, kParseError, "Invalid JSON");
  }

  std::cerr << "Received: " << request->method << "\n";

  if (request->method.empty()) {
    return make_error_response(request->id, kInvalidRequest, "Missing method");
  }
  const auto it = method_registry.find(request->method);
  if (it == method_registry.end()) {
    return make_error_response(request->id, kMethodNotFound,
                               "Unknown method: " + request->method);
  }

  try {
    return make_response(request->id, it->second(*request, ctx));
  } catch (const std::exception& e) {
    std::cerr << "Internal error in " << request->method << ": " << e.what() << "\n";
    return make_error_response(request->id, kInternalError, e.what());
  }
}

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    out << handle_line(line, ctx) << "\n" << std::flush;
  }

  std::cerr << "finval server shutting down\n";
}

}  // namespace finval::server
