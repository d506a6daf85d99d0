#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace footfall {

/**
 * @brief Lifecycle of one pipeline run
 */
enum class RunState : uint8_t {
    IDLE = 0,       // No run started yet
    STARTING,       // Worker launched, source not yet read
    RUNNING,        // Processing frames
    STOPPING,       // Stop requested, finishing the current frame
    STOPPED,        // Worker exited normally (stop request or end of stream)
    ERROR           // Worker exited on an error
};

inline const char* to_string(RunState state) {
    switch (state) {
        case RunState::IDLE: return "IDLE";
        case RunState::STARTING: return "STARTING";
        case RunState::RUNNING: return "RUNNING";
        case RunState::STOPPING: return "STOPPING";
        case RunState::STOPPED: return "STOPPED";
        case RunState::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Run state machine
 *
 * Written by the worker and the controlling thread, read from anywhere.
 * Subscribers are notified on every actual change.
 */
class RunStateMachine {
public:
    using StateCallback = std::function<void(RunState old_state, RunState new_state)>;

    RunStateMachine() : state_(RunState::IDLE) {}

    RunState state() const {
        return state_.load(std::memory_order_acquire);
    }

    /**
     * @brief Set state unconditionally
     *
     * @return true if state changed
     */
    bool set_state(RunState new_state) {
        RunState old_state = state_.exchange(new_state, std::memory_order_acq_rel);

        if (old_state != new_state) {
            notify_state_change(old_state, new_state);
            return true;
        }
        return false;
    }

    /**
     * @brief Transition only if the current state matches expected
     *
     * @return true if transition occurred
     */
    bool transition(RunState expected, RunState new_state) {
        if (state_.compare_exchange_strong(expected, new_state,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
            notify_state_change(expected, new_state);
            return true;
        }
        return false;
    }

    /**
     * @brief True while a worker thread is alive
     */
    bool is_active() const {
        RunState s = state();
        return s == RunState::STARTING ||
               s == RunState::RUNNING ||
               s == RunState::STOPPING;
    }

    void on_state_change(StateCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks_.push_back(std::move(callback));
    }

    const char* state_string() const {
        return to_string(state());
    }

private:
    std::atomic<RunState> state_;
    std::mutex callback_mutex_;
    std::vector<StateCallback> callbacks_;

    void notify_state_change(RunState old_state, RunState new_state) {
        std::vector<StateCallback> callbacks_copy;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callbacks_copy = callbacks_;
        }

        for (const auto& cb : callbacks_copy) {
            cb(old_state, new_state);
        }
    }
};

}  // namespace footfall
