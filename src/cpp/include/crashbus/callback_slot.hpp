#pragma once
#include <functional>
#include <mutex>
#include <chrono>
#include <utility>

namespace crashbus {

/// Holds at most one pending callback for one operation kind.
///
/// Empty -> Pending on Arm(); Pending -> Empty on Take(), ExpireIfDue() or Reset().
/// Arming a pending slot replaces the old callback (last caller wins).
/// Peek() leaves the slot pending, for status callbacks that may fire repeatedly.
template <typename... Args>
class CallbackSlot {
public:
    using Callback = std::function<void(Args...)>;
    using Clock = std::chrono::steady_clock;

    enum class State { Empty, Pending };

    /// A zero timeout means the callback waits forever. Returns true if a pending callback was discarded.
    bool Arm(Callback cb, Clock::duration timeout = Clock::duration::zero()) {
        std::lock_guard<std::mutex> lock(mtx);
        bool replaced = current == State::Pending;
        callback = std::move(cb);
        current = callback ? State::Pending : State::Empty;
        has_deadline = timeout > Clock::duration::zero();
        if (has_deadline) deadline = Clock::now() + timeout;
        return replaced;
    }

    bool Take(Callback& out) {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != State::Pending) return false;
        out = std::move(callback);
        callback = nullptr;
        current = State::Empty;
        has_deadline = false;
        return true;
    }

    bool Peek(Callback& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != State::Pending) return false;
        out = callback;
        return true;
    }

    bool ExpireIfDue(Clock::time_point now) {
        std::lock_guard<std::mutex> lock(mtx);
        if (current != State::Pending || !has_deadline || now < deadline) return false;
        callback = nullptr;
        current = State::Empty;
        has_deadline = false;
        return true;
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mtx);
        callback = nullptr;
        current = State::Empty;
        has_deadline = false;
    }

    State state() const {
        std::lock_guard<std::mutex> lock(mtx);
        return current;
    }

    bool pending() const { return state() == State::Pending; }

private:
    mutable std::mutex mtx;
    State current = State::Empty;
    Callback callback;
    bool has_deadline = false;
    Clock::time_point deadline;
};

} // namespace crashbus
