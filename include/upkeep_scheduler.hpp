#pragma once

#include "logger.hpp"
#include "raffle.hpp"

#include <cstddef>
#include <optional>

namespace raffle {

// Stands in for the external automation network: polls the gate and triggers
// the raffle when it reports that upkeep is needed.
class UpkeepScheduler {
public:
    explicit UpkeepScheduler(Raffle& raffle);

    // Returns the request id when this poll triggered a draw.
    std::optional<RequestId> poll();

    std::size_t getPollCount() const { return polls_; }
    std::size_t getTriggerCount() const { return triggers_; }

private:
    Raffle& raffle_;
    Logger log_;
    std::size_t polls_ = 0;
    std::size_t triggers_ = 0;
};

} // namespace raffle
