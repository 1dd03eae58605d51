// Copyright (C) 2018-2025 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#pragma once

#include <atomic>
#include <thread>

namespace tir {

/// \brief Holds a busy flag for the lifetime of the object.
///
/// Used where a node builds a value lazily and two threads may ask for it at once.
class AtomicGuard {
public:
    explicit AtomicGuard(std::atomic_bool& busy) : m_busy(busy) {
        bool expected = false;
        while (!m_busy.compare_exchange_weak(expected, true, std::memory_order_acquire, std::memory_order_relaxed)) {
            expected = false;
            std::this_thread::yield();
        }
    }

    AtomicGuard(const AtomicGuard&) = delete;
    AtomicGuard& operator=(const AtomicGuard&) = delete;

    ~AtomicGuard() {
        m_busy.store(false, std::memory_order_release);
    }

private:
    std::atomic_bool& m_busy;
};

}  // namespace tir
