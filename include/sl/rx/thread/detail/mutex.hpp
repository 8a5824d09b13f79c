//
// Created by usatiynyan.
// Injection point for mutex-s.
//

#pragma once

#ifndef SL_RX_MUTEX

#include <mutex>
#define SL_RX_MUTEX std::mutex

#endif // SL_RX_MUTEX

namespace sl::rx::detail {

using mutex = SL_RX_MUTEX;

} // namespace sl::rx::detail
