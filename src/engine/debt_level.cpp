#include "engine/debt_level.hpp"

namespace streaks {
namespace engine {

DebtLevel classify_balance(long long balance) {
    if (balance < kLevelN1Floor) return DebtLevel::N0;
    if (balance < kLevelN2Floor) return DebtLevel::N1;
    if (balance < kLevelN3Floor) return DebtLevel::N2;
    if (balance < kLevelN4Floor) return DebtLevel::N3;
    return DebtLevel::N4;
}

std::string to_string(DebtLevel level) {
    switch (level) {
        case DebtLevel::N0: return "N0";
        case DebtLevel::N1: return "N1";
        case DebtLevel::N2: return "N2";
        case DebtLevel::N3: return "N3";
        case DebtLevel::N4: return "N4";
    }
    return "N0";
}

std::ostream& operator<<(std::ostream& os, DebtLevel level) {
    return os << to_string(level);
}

} // namespace engine
} // namespace streaks
