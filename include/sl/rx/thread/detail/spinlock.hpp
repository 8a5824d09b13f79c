//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/thread/detail/atomic.hpp"
#include "sl/rx/thread/detail/polyfill.hpp"

#include <sl/meta/traits/unique.hpp>

namespace sl::rx::detail {

// test-and-test-and-set, satisfies Lockable
template <template <typename> typename Atomic = detail::atomic>
struct spinlock : meta::immovable {
    void lock() noexcept {
        while (true) {
            if (!locked_.exchange(true, std::memory_order::acquire)) {
                return;
            }
            while (locked_.load(std::memory_order::relaxed)) {
                cpu_relax();
            }
        }
    }

    bool try_lock() noexcept {
        return !locked_.load(std::memory_order::relaxed) && !locked_.exchange(true, std::memory_order::acquire);
    }

    void unlock() noexcept { locked_.store(false, std::memory_order::release); }

private:
    alignas(hardware_destructive_interference_size) Atomic<bool> locked_{ false };
};

} // namespace sl::rx::detail
