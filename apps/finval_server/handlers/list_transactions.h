#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace finval::server::handlers {

nlohmann::json handle_list_transactions(const nlohmann::json& params, ServerContext& ctx);

}  // namespace finval::server::handlers
