//
// Created by usatiynyan.
//
// Split reference counting, see "C++ Concurrency in Action" 7.2.4.
// Every installed head gets a fresh cell, so a cell pointer can't reappear in the head while anyone still borrows it,
// which makes pointer comparison sufficient against ABA.
//
// head_: [ borrows | cell* ]
//   borrows - 1 for the head itself + 1 for every thread currently reading the cell
// cell::internal - borrows given back after the cell was replaced, minus borrows transferred on replacement
//

#pragma once

#include "sl/rx/slot/head.hpp"
#include "sl/rx/thread/detail/atomic.hpp"
#include "sl/rx/thread/detail/counted_ptr.hpp"
#include "sl/rx/thread/detail/polyfill.hpp"

#include <sl/meta/lifetime/defer.hpp>
#include <sl/meta/traits/unique.hpp>

#include <libassert/assert.hpp>

#include <cstdint>
#include <utility>

namespace sl::rx::detail {

template <typename T, template <typename> typename Atomic>
struct lock_free_slot : meta::immovable {
    struct cell : meta::immovable {
        explicit cell(arc<T> a_value) : value{ std::move(a_value) } {}

        arc<T> value;
        Atomic<std::int64_t> internal{ 0 };
    };

    using packed = counted_ptr<cell>;

public:
    explicit lock_free_slot(slot_head<T> initial) : head_{ install(std::move(initial)).get_raw() } {}

    ~lock_free_slot() noexcept {
        const packed current = packed::restore(head_.load(std::memory_order::acquire));
        if (cell* const current_cell = current.get_ptr(); current_cell != nullptr) {
            DEBUG_ASSERT(current.get_count() == 1u, "slot destroyed while being read");
            delete current_cell;
        }
    }

    slot_head<T> head() const {
        const packed borrowed = borrow();
        cell* const borrowed_cell = borrowed.get_ptr();
        if (borrowed_cell == nullptr) {
            return tl::nullopt;
        }
        slot_head<T> result{ borrowed_cell->value };
        give_back(borrowed_cell);
        return result;
    }

    template <SlotTransform<T> F>
    update_result<T> update(F& transform) {
        while (true) {
            const packed borrowed = borrow();
            cell* const old_cell = borrowed.get_ptr();
            // the borrow goes back unless it was transferred by retire, transform and install may throw
            bool retired = false;
            meta::defer return_borrow{ [this, old_cell, &retired] {
                if (old_cell != nullptr && !retired) {
                    give_back(old_cell);
                }
            } };

            slot_head<T> old_head = old_cell == nullptr ? slot_head<T>{} : slot_head<T>{ old_cell->value };

            slot_head<T> new_head = transform(std::as_const(old_head));
            const packed desired = install(new_head);

            std::uintptr_t expected = borrowed.get_raw();
            while (true) {
                if (head_.compare_exchange_weak(
                        expected, desired.get_raw(), std::memory_order::acq_rel, std::memory_order::acquire
                    )) {
                    if (old_cell != nullptr) {
                        retired = true;
                        retire(old_cell, packed::restore(expected).get_count());
                    }
                    return update_result<T>{ std::move(old_head), std::move(new_head) };
                }
                // only borrows changed, old_head is still the current value
                if (!packed::restore(expected).same_ptr(borrowed)) {
                    break;
                }
            }

            delete desired.get_ptr(); // was never published
        }
    }

private:
    static packed install(const slot_head<T>& maybe_value) {
        if (!maybe_value.has_value()) {
            return packed::make(nullptr);
        }
        return packed::make(new cell{ maybe_value.value() }, /* count = */ 1u);
    }

    packed borrow() const {
        std::uintptr_t current = head_.load(std::memory_order::relaxed);
        while (true) {
            const packed current_packed = packed::restore(current);
            if (current_packed.get_ptr() == nullptr) {
                return current_packed;
            }
            const packed borrowed = current_packed.inc();
            if (head_.compare_exchange_weak(
                    current, borrowed.get_raw(), std::memory_order::acquire, std::memory_order::relaxed
                )) {
                return borrowed;
            }
        }
    }

    void give_back(cell* borrowed_cell) const {
        std::uintptr_t current = head_.load(std::memory_order::relaxed);
        while (packed::restore(current).get_ptr() == borrowed_cell) {
            if (head_.compare_exchange_weak(
                    current,
                    packed::restore(current).dec().get_raw(),
                    std::memory_order::release,
                    std::memory_order::relaxed
                )) {
                return;
            }
        }
        // replaced in the meantime, our borrow was transferred to the cell
        if (borrowed_cell->internal.fetch_sub(1, std::memory_order::acq_rel) == 1) {
            delete borrowed_cell;
        }
    }

    // minus the head itself and the replacing thread
    static void retire(cell* old_cell, std::uintptr_t borrows) {
        DEBUG_ASSERT(borrows >= 2u);
        const auto others = static_cast<std::int64_t>(borrows) - 2;
        if (old_cell->internal.fetch_add(others, std::memory_order::acq_rel) == -others) {
            delete old_cell;
        }
    }

private:
    alignas(hardware_destructive_interference_size) mutable Atomic<std::uintptr_t> head_;
};

} // namespace sl::rx::detail
