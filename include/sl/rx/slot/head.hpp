//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/thread/arc.hpp"

#include <sl/meta/monad/maybe.hpp>

#include <concepts>
#include <type_traits>

namespace sl::rx {

template <typename T>
using slot_head = meta::maybe<arc<T>>;

template <typename T>
struct [[nodiscard]] update_result {
    slot_head<T> old_head;
    slot_head<T> new_head;
};

// has to be pure, lock-free backend may call it more than once per update
template <typename F, typename T>
concept SlotTransform = std::is_invocable_r_v<slot_head<T>, F&, const slot_head<T>&>;

} // namespace sl::rx
