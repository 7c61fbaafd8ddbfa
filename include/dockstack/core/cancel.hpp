/*
 * Cooperative cancellation flag - DockStack
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>

namespace dockstack {

// Upper bound between two cancellation checks in every worker loop (poll
// timeouts, sleep slices, reap polling). A cooperative worker stops at most
// one interval plus one read after its flag is set.
inline constexpr std::chrono::milliseconds cancel_poll_interval{50};

// Shared boolean signal. Copies share the same state; once set it stays set.
class CancellationFlag {
public:
    CancellationFlag() : m_state(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_state->store(true, std::memory_order_release); }
    bool is_cancelled() const { return m_state->load(std::memory_order_acquire); }
    bool shares_state_with(const CancellationFlag& other) const { return m_state == other.m_state; }

private:
    std::shared_ptr<std::atomic<bool>> m_state;
};

} // namespace dockstack
