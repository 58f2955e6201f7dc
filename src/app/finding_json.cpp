#include "finval/app/finding_json.h"

#include <string>

namespace finval::app {

nlohmann::json finding_to_json(const validation::FieldFinding& finding) {
  nlohmann::json j;
  j["field"] = finding.field;
  j["valid"] = finding.valid;
  if (finding.normalized.has_value()) {
    j["normalized"] = *finding.normalized;
  }
  if (finding.error_code.has_value()) {
    j["error_code"] = std::string{validation::error_code_name(*finding.error_code)};
    j["error_message"] = finding.message;
  }
  return j;
}

nlohmann::json findings_to_json(const std::vector<validation::FieldFinding>& findings) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& finding : findings) {
    out.push_back(finding_to_json(finding));
  }
  return out;
}

nlohmann::json failure_to_json(const FlowFailure& failure) {
  nlohmann::json j;
  j["kind"] = std::string{flow_error_kind_name(failure.kind)};
  j["message"] = failure.message;
  j["findings"] = findings_to_json(failure.findings);
  return j;
}

}  // namespace finval::app
