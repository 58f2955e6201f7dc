#pragma once

#include "finval/app/app_service.h"
#include "finval/validation/field_rules.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace finval::app {

// {"field", "valid", "normalized"?, "error_code"?, "error_message"?}
[[nodiscard]] nlohmann::json finding_to_json(const validation::FieldFinding& finding);

[[nodiscard]] nlohmann::json findings_to_json(const std::vector<validation::FieldFinding>& findings);

// {"kind", "message", "findings"}
[[nodiscard]] nlohmann::json failure_to_json(const FlowFailure& failure);

}  // namespace finval::app
