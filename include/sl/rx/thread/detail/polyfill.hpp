//
// Created by usatiynyan.
//

#pragma once

#if !SL_RX_INTERFERENCE_SIZE
#ifdef __cpp_lib_hardware_interference_size
#include <new>
#endif
#endif

#include <cstddef>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#include <immintrin.h>
#endif

namespace sl::rx::detail {

#if !SL_RX_INTERFERENCE_SIZE
#ifdef __cpp_lib_hardware_interference_size
using std::hardware_constructive_interference_size;
using std::hardware_destructive_interference_size;
#else
constexpr std::size_t hardware_constructive_interference_size = 64;
constexpr std::size_t hardware_destructive_interference_size = 64;
#endif
#else
constexpr std::size_t hardware_constructive_interference_size = SL_RX_INTERFERENCE_SIZE;
constexpr std::size_t hardware_destructive_interference_size = SL_RX_INTERFERENCE_SIZE;
#endif

inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    _mm_pause();
#elif defined(__aarch64__)
    asm volatile("yield" ::: "memory");
#endif
}

} // namespace sl::rx::detail
