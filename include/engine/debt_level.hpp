#pragma once

#include <string>
#include <ostream>

namespace streaks {
namespace engine {

enum class DebtLevel {
    N0,
    N1,
    N2,
    N3,
    N4
};

// Lower bound of each level above N0. A balance equal to a bound belongs
// to the higher level.
constexpr long long kLevelN1Floor = 300000;
constexpr long long kLevelN2Floor = 1000000;
constexpr long long kLevelN3Floor = 3000000;
constexpr long long kLevelN4Floor = 5000000;

// Assumed for every month in a client's range with no observation.
constexpr DebtLevel kDefaultLevel = DebtLevel::N0;

DebtLevel classify_balance(long long balance);

std::string to_string(DebtLevel level);

std::ostream& operator<<(std::ostream& os, DebtLevel level);

} // namespace engine
} // namespace streaks
