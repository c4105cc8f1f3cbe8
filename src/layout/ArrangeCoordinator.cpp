#include "mindarbor/layout/ArrangeCoordinator.h"
#include "mindarbor/common/Logger.h"

namespace mindarbor {

void ArrangeCoordinator::requestArrange(uint64_t currentTimeMs) {
    ++pendingRequests_;
    lastRequestMs_ = currentTimeMs;
    state_ = ArrangeState::Pending;

    if (debounceDelayMs_ == 0) {
        execute();
    }
}

bool ArrangeCoordinator::update(uint64_t currentTimeMs) {
    if (state_ != ArrangeState::Pending) {
        return false;
    }

    // Clock going backwards counts as no time elapsed
    uint64_t elapsed = currentTimeMs > lastRequestMs_ ? currentTimeMs - lastRequestMs_ : 0;
    if (elapsed < debounceDelayMs_) {
        return false;
    }

    execute();
    return true;
}

bool ArrangeCoordinator::flush() {
    if (state_ != ArrangeState::Pending) {
        return false;
    }
    execute();
    return true;
}

void ArrangeCoordinator::cancel() {
    if (state_ == ArrangeState::Pending) {
        LOG_DEBUG("cancelled {} pending arrange requests", pendingRequests_);
    }
    state_ = ArrangeState::Idle;
    pendingRequests_ = 0;
}

void ArrangeCoordinator::execute() {
    uint32_t coalesced = pendingRequests_;
    state_ = ArrangeState::Idle;
    pendingRequests_ = 0;

    if (callback_) {
        callback_();
    }
    LOG_TRACE("arrange executed for {} requests", coalesced);

    if (listener_) {
        listener_->onArrangeExecuted(coalesced);
    }
}

}  // namespace mindarbor
