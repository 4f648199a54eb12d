#include <autograder/subprocess/deadline.hpp>

#include <autograder/logging.hpp>

#include <chrono>
#include <mutex>
#include <stop_token>
#include <thread>
#include <tuple>
#include <utility>

namespace autograder {

Deadline::Deadline(std::chrono::milliseconds timeout, Callback on_expire)
    : on_expire_{std::move(on_expire)}
    , thread_{[this, timeout](const std::stop_token& stop) { wait_and_fire(stop, timeout); }} {}

Deadline::~Deadline() {
    disarm();
}

bool Deadline::disarm() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }

    return fired_.load();
}

void Deadline::wait_and_fire(const std::stop_token& stop, std::chrono::milliseconds timeout) {
    std::unique_lock lock{mutex_};

    // Nothing ever notifies cv_ directly; only the stop request or the timeout end the wait
    std::ignore = cv_.wait_for(lock, stop, timeout, [] { return false; });

    if (stop.stop_requested()) {
        return;
    }

    LOG_DEBUG("Deadline of {} expired", timeout);

    fired_.store(true);
    on_expire_();
}

} // namespace autograder
