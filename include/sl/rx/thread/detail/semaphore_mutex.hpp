//
// Created by usatiynyan.
//

#pragma once

#include <sl/meta/traits/unique.hpp>

#include <semaphore>

namespace sl::rx::detail {

// counting semaphore with a single permit used as a mutex, satisfies Lockable
struct semaphore_mutex : meta::immovable {
    void lock() noexcept { permit_.acquire(); }
    bool try_lock() noexcept { return permit_.try_acquire(); }
    void unlock() noexcept { permit_.release(); }

private:
    std::binary_semaphore permit_{ 1 };
};

} // namespace sl::rx::detail
