#pragma once

#include <nlohmann/json.hpp>

#include "finval/app/app_service.h"
#include "finval/domain/funding_source.h"
#include "finval/validation/amount.h"

#include <optional>
#include <string>

namespace finval::server::handlers {

// Parameter extraction for tool handlers. A parameter of the wrong JSON type is a
// caller contract violation and throws std::invalid_argument; the handler turns it
// into {"error": ...}. Absent or null optional parameters are std::nullopt so the
// validators can report them as missing.

[[nodiscard]] std::string required_string(const nlohmann::json& params, const std::string& key);
[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& params,
                                                         const std::string& key);

// Strings and numbers only. Booleans, objects, arrays and null throw.
[[nodiscard]] validation::AmountInput amount_from_json(const nlohmann::json& value);

// {"type": "card"|"bank", "account_number": "...", "routing_number"?: "..."}
[[nodiscard]] domain::FundingSource funding_source_from_json(const nlohmann::json& value);

// trace_id from params, or a fresh one so failures can be correlated too.
[[nodiscard]] std::string trace_id_or_new(const nlohmann::json& params, core::IIdGenerator& id_gen);

// {"trace_id", "error", "failure": {"kind", "message", "findings"}}
[[nodiscard]] nlohmann::json flow_failure_result(const std::string& trace_id,
                                                 const app::FlowFailure& failure);

}  // namespace finval::server::handlers
