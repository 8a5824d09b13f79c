//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/config.hpp"
#include "sl/rx/slot/backend/lock_free.hpp"
#include "sl/rx/slot/backend/locking.hpp"
#include "sl/rx/slot/head.hpp"
#include "sl/rx/thread/detail/atomic.hpp"
#include "sl/rx/thread/detail/mutex.hpp"
#include "sl/rx/thread/detail/semaphore_mutex.hpp"
#include "sl/rx/thread/detail/spinlock.hpp"

#include <sl/meta/traits/unique.hpp>

#include <cstdint>
#include <type_traits>
#include <utility>

namespace sl::rx {
namespace slot_backend {

struct lock_free {
    template <typename T>
    using impl = detail::lock_free_slot<T, detail::atomic>;
};

struct mutex {
    template <typename T>
    using impl = detail::locking_slot<T, detail::mutex>;
};

struct spinlock {
    template <typename T>
    using impl = detail::locking_slot<T, detail::spinlock<>>;
};

struct semaphore {
    template <typename T>
    using impl = detail::locking_slot<T, detail::semaphore_mutex>;
};

inline constexpr bool lock_free_supported = sizeof(std::uintptr_t) == 8
                                            && detail::atomic<std::uintptr_t>::is_always_lock_free;

#ifdef SL_RX_SLOT_BACKEND
using platform_default = SL_RX_SLOT_BACKEND;
#else
using platform_default = std::conditional_t<lock_free_supported, lock_free, mutex>;
#endif

} // namespace slot_backend

template <typename BackendT>
concept SlotBackend = requires { typename BackendT::template impl<int>; };

template <typename T, SlotBackend BackendT = slot_backend::platform_default>
struct atomic_slot : meta::immovable {
    using head_type = slot_head<T>;
    using backend_type = BackendT;

public:
    atomic_slot() : impl_{ head_type{} } {}
    explicit atomic_slot(head_type initial) : impl_{ std::move(initial) } {}

    [[nodiscard]] head_type head() const { return impl_.head(); }

    template <SlotTransform<T> F>
    update_result<T> update(F&& transform) {
        return impl_.update(transform);
    }

    update_result<T> exchange(head_type new_head) {
        return update([&new_head](const head_type&) { return new_head; });
    }

    head_type reset() { return exchange(tl::nullopt).old_head; }

private:
    typename BackendT::template impl<T> impl_;
};

template <typename T, SlotBackend BackendT = slot_backend::platform_default>
atomic_slot<T, BackendT> make_atomic_slot(slot_head<T> initial = tl::nullopt) {
    return atomic_slot<T, BackendT>{ std::move(initial) };
}

} // namespace sl::rx
