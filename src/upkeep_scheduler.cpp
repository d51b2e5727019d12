#include "upkeep_scheduler.hpp"

namespace raffle {

UpkeepScheduler::UpkeepScheduler(Raffle& raffle)
    : raffle_(raffle)
    , log_(createLogger("upkeep")) {}

std::optional<RequestId> UpkeepScheduler::poll() {
    ++polls_;
    UpkeepCheck check = raffle_.checkUpkeep();
    if (!check.needed) {
        log_->trace("poll {}: upkeep not needed", polls_);
        return std::nullopt;
    }
    try {
        RequestId id = raffle_.performUpkeep(check.performData);
        ++triggers_;
        log_->debug("poll {}: triggered request {}", polls_, id);
        return id;
    } catch (const std::exception& ex) {
        log_->error("poll {}: trigger failed: {}", polls_, ex.what());
        throw;
    }
}

} // namespace raffle
