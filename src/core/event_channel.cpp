/*
 * Event channel (many producers, one consumer) - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <dockstack/core/event_channel.hpp>
#include <iterator>

namespace dockstack {

bool EventSender::send(Event ev) const {
    if (!m_state) return false;
    {
        std::lock_guard<std::mutex> lk(m_state->mutex);
        if (m_state->closed) return false;
        m_state->queue.push_back(std::move(ev));
    }
    m_state->ready.notify_one();
    return true;
}

bool EventSender::is_open() const {
    if (!m_state) return false;
    std::lock_guard<std::mutex> lk(m_state->mutex);
    return !m_state->closed;
}

EventChannel::EventChannel() : m_state(std::make_shared<detail::ChannelState>()) {}

EventChannel::~EventChannel() { close(); }

EventSender EventChannel::sender() const { return EventSender(m_state); }

std::vector<Event> EventChannel::drain() {
    std::deque<Event> taken;
    {
        std::lock_guard<std::mutex> lk(m_state->mutex);
        taken.swap(m_state->queue);
    }
    return std::vector<Event>(std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
}

bool EventChannel::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_state->mutex);
    return m_state->ready.wait_for(lk, timeout, [&]{ return !m_state->queue.empty() || m_state->closed; })
        && !m_state->queue.empty();
}

std::size_t EventChannel::pending() const {
    std::lock_guard<std::mutex> lk(m_state->mutex);
    return m_state->queue.size();
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lk(m_state->mutex);
        m_state->closed = true;
    }
    m_state->ready.notify_all();
}

} // namespace dockstack
