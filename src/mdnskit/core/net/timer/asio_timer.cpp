/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/core/net/timer/asio_timer.hpp"

#include "mdnskit/core/log.hpp"

#include <utility>

mdk::AsioTimer::AsioTimer(boost::asio::io_context& io_context) : timer_(io_context) {}

mdk::AsioTimer::~AsioTimer() {
    stop();
}

void mdk::AsioTimer::once(const std::chrono::milliseconds duration, TimerCallback cb) {
    start(duration, std::move(cb), false);
}

void mdk::AsioTimer::start(const std::chrono::milliseconds duration, TimerCallback cb, const bool repeating) {
    std::lock_guard lock(mutex_);
    timer_.cancel();
    callback_ = std::move(cb);
    duration_ = duration;
    repeating_ = repeating;
    ++generation_;
    wait();
}

void mdk::AsioTimer::stop() {
    std::lock_guard lock(mutex_);
    timer_.cancel();
    callback_ = nullptr;
    repeating_ = false;
    ++generation_;
}

bool mdk::AsioTimer::is_running() const {
    std::lock_guard lock(mutex_);
    return callback_ != nullptr;
}

void mdk::AsioTimer::wait() {
    timer_.expires_after(duration_);
    // A handler whose cancellation raced with its completion still runs with a success code. The generation check
    // makes sure such a stale handler doesn't fire a callback which was replaced or stopped in the meantime.
    timer_.async_wait([this, generation = generation_](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }

        if (ec) {
            MDK_ERROR("Timer error: {}", ec.message());
            return;
        }

        std::lock_guard lock(mutex_);
        if (!callback_ || generation != generation_) {
            return;
        }
        if (repeating_) {
            auto cb = callback_;
            wait();
            cb();
            return;
        }
        auto cb = std::exchange(callback_, nullptr);
        cb();
    });
}
