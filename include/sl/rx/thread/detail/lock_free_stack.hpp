//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/thread/detail/atomic.hpp"

#include <sl/meta/intrusive/algorithm.hpp>
#include <sl/meta/intrusive/forward_list.hpp>

namespace sl::rx::detail {

// MPSC: any thread may push, a single consumer at a time extracts everything at once.
template <typename T, template <typename> typename Atomic = detail::atomic>
struct lock_free_stack {
    using node_type = meta::intrusive_forward_list_node<T>;

    void push(node_type* new_node) {
        new_node->intrusive_next = head_.load(std::memory_order::relaxed);

        while (!head_.compare_exchange_weak(
            new_node->intrusive_next, new_node, std::memory_order::release, std::memory_order::relaxed
        )) {}
    }

    // newest first
    node_type* extract() {
        node_type* old_head = head_.load(std::memory_order::relaxed);

        while (old_head != nullptr
               && !head_.compare_exchange_weak(old_head, nullptr, std::memory_order::acquire, std::memory_order::relaxed)
        ) {}

        return old_head;
    }

    // oldest first
    node_type* extract_fifo() {
        node_type* head = extract();
        return head == nullptr ? nullptr : meta::intrusive_forward_list_node_reverse(head);
    }

private:
    Atomic<node_type*> head_{ nullptr };
};

} // namespace sl::rx::detail
