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

#include "mdnskit/core/assert.hpp"

#include <algorithm>
#include <functional>
#include <vector>

namespace mdk {

/**
 * List of non-owning subscriber pointers, in order of subscription. The list may be modified from within foreach(),
 * which is how a transport delivers datagrams to sessions that stop themselves while handling one.
 * Not thread safe. A subscriber must remove itself before it is destroyed.
 * @tparam T The type of the subscriber.
 */
template<class T>
class SubscriberList {
  public:
    SubscriberList() = default;

    ~SubscriberList() {
        MDK_ASSERT_NO_THROW(
            subscribers_.empty(),
            "Subscriber list destroyed while subscribers are still registered"
        );
    }

    SubscriberList(const SubscriberList&) = delete;
    SubscriberList& operator=(const SubscriberList&) = delete;

    SubscriberList(SubscriberList&&) = delete;
    SubscriberList& operator=(SubscriberList&&) = delete;

    /**
     * Adds the given subscriber to the list.
     * @param subscriber The subscriber to add.
     * @return true if the subscriber was added, or false if it was already in the list.
     */
    [[nodiscard]] bool add(T* subscriber) {
        if (contains(subscriber)) {
            return false;
        }
        subscribers_.push_back(subscriber);
        return true;
    }

    /**
     * Removes the given subscriber from the list.
     * @param subscriber The subscriber to remove.
     * @return true if the subscriber was removed, or false if it was not in the list.
     */
    [[nodiscard]] bool remove(const T* subscriber) {
        const auto it = std::find(subscribers_.begin(), subscribers_.end(), subscriber);
        if (it == subscribers_.end()) {
            return false;
        }
        subscribers_.erase(it);
        return true;
    }

    /**
     * Calls given function for each subscriber. Subscribers removed by the function itself (or by an earlier call)
     * are skipped, subscribers added during the iteration are not visited.
     * @param f The function to call for each subscriber. Must be not null.
     */
    void foreach (const std::function<void(T*)>& f) {
        const auto snapshot = subscribers_;
        for (auto* subscriber : snapshot) {
            if (contains(subscriber)) {
                f(subscriber);
            }
        }
    }

    /**
     * Clears the list.
     */
    void clear() {
        subscribers_.clear();
    }

    /**
     * @returns The number of subscribers.
     */
    [[nodiscard]] size_t size() const {
        return subscribers_.size();
    }

    /**
     * @return true if there are no subscribers.
     */
    [[nodiscard]] bool empty() const {
        return subscribers_.empty();
    }

    /**
     * Checks if the list contains the given subscriber.
     * @param subscriber The subscriber to check.
     * @return true if the list contains the subscriber, or false if not.
     */
    [[nodiscard]] bool contains(const T* subscriber) const {
        return std::find(subscribers_.begin(), subscribers_.end(), subscriber) != subscribers_.end();
    }

  private:
    std::vector<T*> subscribers_;
};

}  // namespace mdk
