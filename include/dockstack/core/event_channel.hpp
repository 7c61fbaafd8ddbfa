/*
 * Event channel (many producers, one consumer) - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <dockstack/core/event.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace dockstack {

namespace detail {
struct ChannelState {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<Event> queue;
    bool closed = false;
};
} // namespace detail

// Producer endpoint. Cheap to copy; safe to use after the channel is gone.
class EventSender {
public:
    EventSender() = default;
    // Returns false if the channel was closed (event dropped).
    bool send(Event ev) const;
    bool is_open() const;
private:
    friend class EventChannel;
    explicit EventSender(std::shared_ptr<detail::ChannelState> st) : m_state(std::move(st)) {}
    std::shared_ptr<detail::ChannelState> m_state;
};

// Consumer endpoint. One FIFO queue: events from one producer keep the order
// they were sent in; producers interleave arbitrarily.
class EventChannel {
public:
    EventChannel();
    ~EventChannel();
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    EventSender sender() const;
    // Takes everything currently queued; never waits for producers.
    std::vector<Event> drain();
    // Blocks up to `timeout` until at least one event is queued. Not for the render loop.
    bool wait_for(std::chrono::milliseconds timeout);
    std::size_t pending() const;
    void close();

private:
    std::shared_ptr<detail::ChannelState> m_state;
};

} // namespace dockstack
