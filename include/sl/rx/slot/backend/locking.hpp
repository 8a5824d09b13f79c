//
// Created by usatiynyan.
//
// Same external behaviour as the lock-free slot, transform is called exactly once under the lock.
//

#pragma once

#include "sl/rx/slot/head.hpp"

#include <sl/meta/traits/unique.hpp>

#include <mutex>
#include <utility>

namespace sl::rx::detail {

template <typename T, typename Lockable>
struct locking_slot : meta::immovable {
    explicit locking_slot(slot_head<T> initial) : head_{ std::move(initial) } {}

    slot_head<T> head() const {
        std::lock_guard<Lockable> lock{ lock_ };
        return head_;
    }

    template <SlotTransform<T> F>
    update_result<T> update(F& transform) {
        std::unique_lock<Lockable> lock{ lock_ };
        slot_head<T> new_head = transform(std::as_const(head_));
        slot_head<T> old_head = std::exchange(head_, new_head);
        lock.unlock();
        // old head is released outside of the critical section
        return update_result<T>{ std::move(old_head), std::move(new_head) };
    }

private:
    mutable Lockable lock_{};
    slot_head<T> head_;
};

} // namespace sl::rx::detail
