#include "validate_field.h"

#include "finval/app/finding_json.h"
#include "finval/validation/amount.h"
#include "finval/validation/field_rules.h"
#include "request_parsing.h"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace finval::server::handlers {

using json = nlohmann::json;

json handle_validate_field(const json& params, ServerContext& /*ctx*/) {
  try {
    const std::string field_name = required_string(params, "field");
    const auto field = validation::parse_field(field_name);
    if (!field.has_value()) {
      throw std::invalid_argument("Unknown field: " + field_name);
    }

    // Amounts also accept JSON numbers; every other field is text.
    if (*field == validation::Field::kAmount && params.contains("value") &&
        params["value"].is_number()) {
      const auto verdict = validation::validate_amount_input(amount_from_json(params["value"]));
      std::optional<std::string> normalized;
      if (verdict.valid()) {
        normalized = verdict.normalized()->formatted;
      }
      return app::finding_to_json(validation::to_finding(field_name, verdict, normalized));
    }

    const auto value = optional_string(params, "value");
    std::optional<std::string_view> raw;
    if (value.has_value()) {
      raw = *value;
    }
    return app::finding_to_json(validation::validate_field(*field, raw));

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace finval::server::handlers
