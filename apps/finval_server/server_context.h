#pragma once

#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/password_hash.h"
#include "finval/core/services.h"

#include "config.h"

namespace finval::server {

// ServerContext holds the process-lifetime references passed to every tool handler.
// All references must outlive run_server_loop().
struct ServerContext {
  core::Services& services;     // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;   // NOLINT(readability-identifier-naming)
  core::IClock& clock;          // NOLINT(readability-identifier-naming)
  core::ISaltSource& salts;     // NOLINT(readability-identifier-naming)
  const ServerConfig& config;   // NOLINT(readability-identifier-naming)
};

}  // namespace finval::server
