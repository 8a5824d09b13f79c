//
// Created by usatiynyan.
//
// Immutable singly-linked list with structural sharing, meant to be the head of an atomic_slot.
// Every modification builds a new list, nodes of the old one stay valid for whoever still holds them.
//

#pragma once

#include "sl/rx/slot/head.hpp"

#include <utility>

namespace sl::rx {

template <typename T>
struct persistent_list_node {
    persistent_list_node(T a_value, slot_head<persistent_list_node> a_next)
        : value{ std::move(a_value) }, next{ std::move(a_next) } {}

    T value;
    slot_head<persistent_list_node> next;
};

template <typename T>
using persistent_list = slot_head<persistent_list_node<T>>;

template <typename T>
persistent_list<T> push_front(const persistent_list<T>& list, T value) {
    return arc<persistent_list_node<T>>::make(std::move(value), list);
}

template <typename T, typename F>
void for_each(const persistent_list<T>& list, F&& f) {
    const persistent_list_node<T>* node = list.has_value() ? list->get() : nullptr;
    while (node != nullptr) {
        f(node->value);
        node = node->next.has_value() ? node->next->get() : nullptr;
    }
}

// keeps relative order, shares the untouched tail
template <typename T, typename Predicate>
persistent_list<T> remove_if(const persistent_list<T>& list, Predicate&& predicate) {
    if (!list.has_value()) {
        return list;
    }
    const persistent_list_node<T>& node = **list;
    persistent_list<T> rest = remove_if(node.next, predicate);
    if (predicate(node.value)) {
        return rest;
    }
    const bool same_tail = rest.has_value() ? node.next.has_value() && rest.value() == node.next.value()
                                            : !node.next.has_value();
    if (same_tail) {
        return list;
    }
    return arc<persistent_list_node<T>>::make(node.value, std::move(rest));
}

} // namespace sl::rx
