//
// Created by usatiynyan.
// Injection point for atomics.
//

#pragma once

#ifndef SL_RX_ATOMIC

#include <atomic>
#define SL_RX_ATOMIC std::atomic

#endif // SL_RX_ATOMIC

namespace sl::rx::detail {

template <typename T>
using atomic = SL_RX_ATOMIC<T>;

} // namespace sl::rx::detail
