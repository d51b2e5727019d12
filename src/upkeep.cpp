#include "upkeep.hpp"

namespace raffle {

UpkeepCheck evaluateUpkeep(const UpkeepInputs& inputs) {
    UpkeepCheck check;
    check.timePassed = inputs.intervalElapsed;
    check.isOpen = inputs.state == RaffleState::OPEN;
    check.hasBalance = inputs.balance > 0;
    check.hasPlayers = inputs.participants > 0;
    check.needed = check.timePassed && check.isOpen && check.hasBalance && check.hasPlayers;
    return check;
}

} // namespace raffle
