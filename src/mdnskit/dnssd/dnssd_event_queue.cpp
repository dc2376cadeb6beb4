/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "mdnskit/dnssd/dnssd_event_queue.hpp"

#include "mdnskit/core/assert.hpp"

#include <iterator>

mdk::dnssd::EventQueue::EventQueue(const size_t max_size) : max_size_(max_size) {
    MDK_ASSERT(max_size_ > 0, "Max size should be greater than 0");
}

void mdk::dnssd::EventQueue::set_notify_callback(NotifyCallback callback) {
    std::lock_guard lock(mutex_);
    notify_callback_ = std::move(callback);
}

std::optional<mdk::dnssd::Event> mdk::dnssd::EventQueue::try_pop() {
    std::lock_guard lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<mdk::dnssd::Event> mdk::dnssd::EventQueue::pop_all() {
    std::lock_guard lock(mutex_);
    std::vector<Event> events(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
    events_.clear();
    return events;
}

size_t mdk::dnssd::EventQueue::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

size_t mdk::dnssd::EventQueue::dropped_count() const {
    std::lock_guard lock(mutex_);
    return dropped_count_;
}

void mdk::dnssd::EventQueue::on_event(const Event& event) {
    NotifyCallback notify;
    {
        std::lock_guard lock(mutex_);
        events_.push_back(event);

        // Remove front elements if the queue exceeds the maximum size
        while (events_.size() > max_size_) {
            events_.pop_front();
            ++dropped_count_;
        }
        notify = notify_callback_;
    }

    if (notify) {
        notify();
    }
}
