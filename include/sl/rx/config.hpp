//
// Created by usatiynyan.
// Compile-time configuration, every value may be overridden with a definition.
//

#pragma once

#include <cstddef>

#ifndef SL_RX_DEFAULT_BUFFER_SIZE
#define SL_RX_DEFAULT_BUFFER_SIZE 1024
#endif // SL_RX_DEFAULT_BUFFER_SIZE

// SL_RX_SLOT_BACKEND: one of lock_free, mutex, spinlock, semaphore
// SL_RX_ATOMIC: see sl/rx/thread/detail/atomic.hpp
// SL_RX_MUTEX: see sl/rx/thread/detail/mutex.hpp
// SL_RX_INTERFERENCE_SIZE: see sl/rx/thread/detail/polyfill.hpp

namespace sl::rx {

inline constexpr std::size_t default_buffer_size = SL_RX_DEFAULT_BUFFER_SIZE;
static_assert(default_buffer_size > 0);

} // namespace sl::rx
