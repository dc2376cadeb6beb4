/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "dnssd_events.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace mdk::dnssd {

/**
 * Listener which buffers events so they can be consumed from another thread. When the queue is full the oldest event
 * is dropped. Thread safe.
 */
class EventQueue: public Listener {
  public:
    static constexpr size_t k_default_max_size = 1024;

    /// Called after an event was added, from the thread which added it.
    using NotifyCallback = std::function<void()>;

    explicit EventQueue(size_t max_size = k_default_max_size);

    /**
     * Sets a callback which is called after each added event. Typically used to wake up the consuming thread.
     * @param callback The callback, or nullptr to remove it.
     */
    void set_notify_callback(NotifyCallback callback);

    /**
     * @return The oldest event, or an empty optional if the queue is empty.
     */
    std::optional<Event> try_pop();

    /**
     * @return All events, oldest first. The queue is empty afterwards.
     */
    std::vector<Event> pop_all();

    [[nodiscard]] size_t size() const;

    /**
     * @return The number of events dropped because the queue was full.
     */
    [[nodiscard]] size_t dropped_count() const;

    // Listener overrides
    void on_event(const Event& event) override;

  private:
    mutable std::mutex mutex_;
    std::deque<Event> events_;
    size_t max_size_;
    size_t dropped_count_ {};
    NotifyCallback notify_callback_;
};

}  // namespace mdk::dnssd
