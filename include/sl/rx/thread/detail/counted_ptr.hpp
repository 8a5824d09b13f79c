//
// Created by usatiynyan.
//
// Pointer packed together with a small counter in its unused upper bits, so both can be swapped with a single CAS.
// [ 63..48 | 47..0 ]
//   count  | ptr
//

#pragma once

#include "sl/rx/thread/detail/bits.hpp"

#include <libassert/assert.hpp>

#include <bit>
#include <climits>
#include <cstdint>

namespace sl::rx::detail {

template <typename T, std::uintptr_t CountWidth = 16ul>
    requires(sizeof(std::uintptr_t) == 8) && (CountWidth < sizeof(std::uintptr_t) * CHAR_BIT)
struct counted_ptr {
    static constexpr std::uintptr_t ptr_width = sizeof(std::uintptr_t) * CHAR_BIT - CountWidth;
    static constexpr std::uintptr_t ptr_mask = bits::fill_ones<std::uintptr_t>(ptr_width);
    static constexpr std::uintptr_t count_mask = ~ptr_mask;
    static constexpr std::uintptr_t count_max = bits::fill_ones<std::uintptr_t>(CountWidth);
    static constexpr std::uintptr_t count_one = std::uintptr_t{ 1 } << ptr_width;

private:
    constexpr explicit counted_ptr(std::uintptr_t raw) : raw_{ raw } {}

public:
    static counted_ptr make(T* ptr, std::uintptr_t count = 0) {
        const auto ptr_part = std::bit_cast<std::uintptr_t>(ptr);
        ASSERT((ptr_part & count_mask) == 0, "pointer does not fit below the counter", ptr_part, count_mask);
        DEBUG_ASSERT(count <= count_max);
        return counted_ptr{ ptr_part | (count << ptr_width) };
    }

    constexpr static counted_ptr restore(std::uintptr_t raw) { return counted_ptr{ raw }; }

    T* get_ptr() const { return std::bit_cast<T*>(raw_ & ptr_mask); }
    constexpr std::uintptr_t get_count() const { return (raw_ & count_mask) >> ptr_width; }
    constexpr std::uintptr_t get_raw() const { return raw_; }

    counted_ptr inc() const {
        DEBUG_ASSERT(get_count() < count_max, "too many concurrent borrows");
        return counted_ptr{ raw_ + count_one };
    }
    counted_ptr dec() const {
        DEBUG_ASSERT(get_count() > 0);
        return counted_ptr{ raw_ - count_one };
    }

    constexpr bool same_ptr(counted_ptr other) const { return (raw_ & ptr_mask) == (other.raw_ & ptr_mask); }

private:
    std::uintptr_t raw_;
};

} // namespace sl::rx::detail
