#include "signup_logic.h"

#include "finval/app/app_service.h"
#include "finval/app/signup_fields.h"
#include "finval/domain/domain_json.h"

#include "prompt.h"
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace {

const std::map<std::string, std::string>& field_labels() {
  static const std::map<std::string, std::string> labels = {
      {"email", "Email"},
      {"password", "Password"},
      {"first_name", "First name"},
      {"last_name", "Last name"},
      {"phone_number", "Phone number"},
      {"date_of_birth", "Date of birth (YYYY-MM-DD)"},
      {"address", "Street address"},
      {"city", "City"},
      {"state", "State (e.g. CA)"},
      {"zip_code", "ZIP code"},
  };
  return labels;
}

}  // namespace

int execute_signup(std::istream& in, std::ostream& out, finval::core::Services& services,
                   finval::core::IIdGenerator& id_gen, finval::core::IClock& clock,
                   finval::core::ISaltSource& salts) {
  finval::app::SignupRequest request;
  const std::map<std::string, std::optional<std::string>*> slots = {
      {"email", &request.email},
      {"password", &request.password},
      {"first_name", &request.first_name},
      {"last_name", &request.last_name},
      {"phone_number", &request.phone_number},
      {"date_of_birth", &request.date_of_birth},
      {"address", &request.address},
      {"city", &request.city},
      {"state", &request.state},
      {"zip_code", &request.zip_code},
  };

  for (const auto& key : finval::app::signup_field_keys()) {
    auto value = prompt_until_valid(in, out, field_labels().at(key),
                                    [&key](std::optional<std::string_view> raw) {
                                      return finval::app::validate_signup_field(key, raw);
                                    });
    if (!value.has_value()) {
      std::cerr << "Signup cancelled: input ended\n";
      return 1;
    }
    *slots.at(key) = std::move(value);
  }

  try {
    auto outcome = finval::app::run_signup(request, services, id_gen, clock, salts);
    if (!outcome.has_value()) {
      std::cerr << "Signup failed: " << outcome.error().message << "\n";
      return 1;
    }

    out << "Account holder created (trace " << outcome.value().trace_id << ")\n";
    out << finval::domain::user_to_json(outcome.value().user).dump(2) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: signup failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
