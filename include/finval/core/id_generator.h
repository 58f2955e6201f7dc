#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace finval::core {

// Prefixes of every id finval mints. Ids are "<prefix>-<digits>", so the
// prefix alone tells a user id from an account id in logs and audit refs.
namespace id_prefix {
inline constexpr std::string_view kUser = "user";
inline constexpr std::string_view kAccount = "acct";
inline constexpr std::string_view kTransaction = "txn";
inline constexpr std::string_view kTrace = "trace";
inline constexpr std::string_view kAuditEvent = "evt";
}  // namespace id_prefix

// Width of the zero-padded sequence part of an id.
inline constexpr int kIdSequenceWidth = 6;

// Mints ids for users, accounts, transactions, traces and audit events.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty, starts with prefix + "-", and sorts after
  // every ID previously returned by this generator for the same prefix.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "txn-01767225600000000-000000": 17-digit microsecond timestamp, then a
// per-process sequence. Used when the server or CLI runs without --deterministic.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> sequence_{0};
};

// "user-000001", "acct-000002", "evt-000003": one counter shared by all
// prefixes, starting at 1. Replaying the same flows yields the same ids, which
// keeps audit hashes stable in tests and --deterministic runs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> issued_{0};
};

}  // namespace finval::core
