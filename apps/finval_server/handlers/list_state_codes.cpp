#include "list_state_codes.h"

#include "finval/validation/state_code.h"

namespace finval::server::handlers {

using json = nlohmann::json;

json handle_list_state_codes(const json& /*params*/, ServerContext& /*ctx*/) {
  const auto groups = validation::state_codes_by_category();

  json result;
  result["codes"] = validation::all_state_codes();
  result["states"] = groups.states;
  result["federal_district"] = groups.federal_district;
  result["territories"] = groups.territories;
  return result;
}

}  // namespace finval::server::handlers
