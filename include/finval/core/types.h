#pragma once

#include <cstdint>

namespace finval::core {

// Monetary values are held as integer cents so balance arithmetic is exact.
using Cents = std::int64_t;

}  // namespace finval::core
