#include "raffle_types.hpp"

namespace raffle {

const char* toString(RaffleState state) {
    switch (state) {
    case RaffleState::OPEN:
        return "OPEN";
    case RaffleState::CALCULATING:
        return "CALCULATING";
    }
    return "UNKNOWN";
}

} // namespace raffle
