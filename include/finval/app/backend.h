#pragma once

#include "finval/core/result.h"
#include "finval/core/services.h"

#include <memory>
#include <optional>
#include <string>

namespace finval::app {

// Backend owns the persistence collaborators for one process and exposes them
// as core::Services. With a path it opens a single SQLite connection and applies
// the schema (idempotent); without one every repository is in-memory.
// Everything is released when the Backend is destroyed.
class Backend {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<Backend>, std::string> open(
      const std::optional<std::string>& db_path);

  ~Backend();

  Backend(const Backend&) = delete;
  Backend& operator=(const Backend&) = delete;
  Backend(Backend&&) = delete;
  Backend& operator=(Backend&&) = delete;

  [[nodiscard]] core::Services& services() { return *services_; }
  [[nodiscard]] bool persistent() const noexcept { return persistent_; }

 private:
  struct Parts;

  explicit Backend(std::unique_ptr<Parts> parts, bool persistent);

  std::unique_ptr<Parts> parts_;
  std::unique_ptr<core::Services> services_;
  bool persistent_{false};
};

}  // namespace finval::app
