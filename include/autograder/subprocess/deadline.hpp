#pragma once

#include <autograder/common/class_traits.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace autograder {

/// A single-shot deadline running on its own thread.
///
/// Once armed, either `on_expire` is invoked exactly once after `timeout` elapses, or the
/// deadline is disarmed first and `on_expire` is never invoked. Disarming is required
/// before anything `on_expire` refers to is released; the destructor disarms implicitly.
///
/// The deadline never decides anything by itself: the owner asks `disarm()` whether the
/// deadline fired and acts on that answer.
class Deadline : NonMovable
{
public:
    using Callback = std::function<void()>;

    Deadline(std::chrono::milliseconds timeout, Callback on_expire);
    ~Deadline();

    /// Cancel the deadline if it has not yet fired, and wait for its thread to finish.
    /// Returns whether the deadline fired. Idempotent.
    bool disarm();

    bool fired() const noexcept { return fired_.load(); }

private:
    void wait_and_fire(const std::stop_token& stop, std::chrono::milliseconds timeout);

    Callback on_expire_;
    std::atomic<bool> fired_{false};

    std::mutex mutex_;
    std::condition_variable_any cv_;

    // Must be last; the thread uses the members above
    std::jthread thread_;
};

} // namespace autograder
