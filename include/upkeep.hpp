#pragma once

#include "raffle_types.hpp"

#include <cstddef>
#include <string>

namespace raffle {

struct UpkeepInputs {
    bool intervalElapsed = false;
    RaffleState state = RaffleState::OPEN;
    Amount balance = 0;
    std::size_t participants = 0;
};

struct UpkeepCheck {
    bool needed = false;
    bool timePassed = false;
    bool isOpen = false;
    bool hasBalance = false;
    bool hasPlayers = false;
    std::string performData; // always empty; the trigger needs no payload
};

UpkeepCheck evaluateUpkeep(const UpkeepInputs& inputs);

} // namespace raffle
