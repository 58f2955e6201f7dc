#pragma once

#include "finval/core/ids.h"

#include <string>

namespace finval::domain {

// User is a registered customer. Every field is stored in canonical form:
// email lowercased, phone as "+1XXXXXXXXXX", state as an uppercase postal code.
// The plaintext password never reaches this struct; only its encoded hash does.
struct User {
  core::UserId user_id;
  std::string email;
  std::string password_hash;
  std::string first_name;
  std::string last_name;
  std::string phone_number;
  std::string date_of_birth;  // YYYY-MM-DD
  std::string address;
  std::string city;
  std::string state;
  std::string zip_code;
  std::string created_at;
};

}  // namespace finval::domain
