#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace custodian::test_helpers {

/// Steady and system clocks that only move when told to. Copies share state.
class ManualClock {
public:
    ManualClock() : state_(std::make_shared<State>()) {}

    void Advance(const std::chrono::milliseconds delta) {
        state_->offset_ms.fetch_add(delta.count());
    }

    [[nodiscard]] std::function<std::chrono::steady_clock::time_point()> Steady() const {
        return [state = state_]() {
            return state->steady_base + std::chrono::milliseconds(state->offset_ms.load());
        };
    }

    [[nodiscard]] std::function<std::chrono::system_clock::time_point()> System() const {
        return [state = state_]() {
            return state->system_base + std::chrono::milliseconds(state->offset_ms.load());
        };
    }

private:
    struct State {
        std::chrono::steady_clock::time_point steady_base = std::chrono::steady_clock::now();
        std::chrono::system_clock::time_point system_base = std::chrono::system_clock::now();
        std::atomic<int64_t> offset_ms{0};
    };

    std::shared_ptr<State> state_;
};

}
