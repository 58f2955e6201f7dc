#include "tool_registry.h"

#include "create_account.h"
#include "fund_account.h"
#include "get_audit_trace.h"
#include "list_accounts.h"
#include "list_state_codes.h"
#include "list_transactions.h"
#include "signup.h"
#include "validate_field.h"

namespace finval::server::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"validate_field", handle_validate_field},
      {"signup", handle_signup},
      {"create_account", handle_create_account},
      {"list_accounts", handle_list_accounts},
      {"fund_account", handle_fund_account},
      {"list_transactions", handle_list_transactions},
      {"get_audit_trace", handle_get_audit_trace},
      {"list_state_codes", handle_list_state_codes},
  };
}

}  // namespace finval::server::handlers
