#include "finval/core/id_generator.h"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace finval::core {

namespace {

constexpr int kTimestampWidth = 17;

std::string compose(std::string_view prefix, unsigned long long sequence) {
  std::ostringstream oss;
  oss << prefix << '-' << std::setfill('0') << std::setw(kIdSequenceWidth) << sequence;
  return oss.str();
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  const auto sequence = sequence_.fetch_add(1, std::memory_order_relaxed);

  std::ostringstream stamp;
  stamp << std::setfill('0') << std::setw(kTimestampWidth)
        << static_cast<unsigned long long>(micros);
  return compose(std::string(prefix) + "-" + stamp.str(), sequence);
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return compose(prefix, issued_.fetch_add(1, std::memory_order_relaxed) + 1);
}

}  // namespace finval::core
