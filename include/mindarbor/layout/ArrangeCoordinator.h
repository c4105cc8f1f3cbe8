#pragma once

#include <cstdint>
#include <functional>

namespace mindarbor {

/// State of the arrange coordinator
enum class ArrangeState {
    Idle,    ///< Nothing scheduled
    Pending  ///< A request is waiting for the debounce delay to pass
};

/// Listener interface for coalesced arrange runs
class IArrangeListener {
public:
    virtual ~IArrangeListener() = default;

    /// Called after the arrange callback ran
    /// @param coalescedRequests Requests merged into this run
    virtual void onArrangeExecuted(uint32_t coalescedRequests) = 0;
};

/// Trailing-edge debounce for arrange requests.
///
/// Hosts fire requests on every drag tick or edge change; the coordinator
/// runs the arrange callback once, after no new request arrived for the
/// debounce delay. Time is supplied by the caller, nothing runs on a timer.
///
/// Usage:
/// @code
/// ArrangeCoordinator coordinator;
/// coordinator.setDebounceDelay(200);
/// coordinator.setArrangeCallback([&] { pipeline.arrange(takeSnapshot()); });
///
/// // On each edit
/// coordinator.requestArrange(nowMs());
///
/// // Each frame in the host loop
/// coordinator.update(nowMs());
/// @endcode
class ArrangeCoordinator {
public:
    static constexpr uint32_t DEFAULT_DEBOUNCE_DELAY_MS = 300;

    using ArrangeCallback = std::function<void()>;

    ArrangeCoordinator() = default;

    /// Schedule an arrange; restarts the delay if one is already pending.
    /// With a zero delay the callback runs immediately.
    void requestArrange(uint64_t currentTimeMs);

    /// Run the pending arrange if the delay has elapsed
    /// @return true if the callback ran
    bool update(uint64_t currentTimeMs);

    /// Run the pending arrange now, ignoring the delay
    /// @return true if something was pending
    bool flush();

    /// Drop the pending request without running it
    void cancel();

    void setDebounceDelay(uint32_t ms) { debounceDelayMs_ = ms; }
    uint32_t debounceDelay() const { return debounceDelayMs_; }

    void setArrangeCallback(ArrangeCallback callback) { callback_ = std::move(callback); }

    /// @param listener Listener to notify (not owned, must outlive coordinator)
    void setListener(IArrangeListener* listener) { listener_ = listener; }

    ArrangeState state() const { return state_; }
    bool isPending() const { return state_ == ArrangeState::Pending; }
    uint32_t pendingRequests() const { return pendingRequests_; }

private:
    ArrangeState state_ = ArrangeState::Idle;
    uint64_t lastRequestMs_ = 0;
    uint32_t debounceDelayMs_ = DEFAULT_DEBOUNCE_DELAY_MS;
    uint32_t pendingRequests_ = 0;

    ArrangeCallback callback_;
    IArrangeListener* listener_ = nullptr;

    void execute();
};

}  // namespace mindarbor
