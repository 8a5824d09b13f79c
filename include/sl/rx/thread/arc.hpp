//
// Created by usatiynyan.
//
// Atomically reference counted shared ownership with weak references.
// strong_ - number of arc-s, value lives while it's non-zero
// weak_   - number of weak_arc-s + 1 for all the arc-s together, storage lives while it's non-zero
//

#pragma once

#include "sl/rx/thread/detail/atomic.hpp"
#include "sl/rx/thread/detail/polyfill.hpp"

#include <sl/meta/monad/maybe.hpp>
#include <sl/meta/traits/unique.hpp>

#include <libassert/assert.hpp>
#include <tl/optional.hpp>

#include <cstdint>
#include <utility>

namespace sl::rx {
namespace detail {

template <typename T, template <typename> typename Atomic>
struct [[nodiscard]] arc_storage : meta::immovable {
    template <typename... Args>
    explicit arc_storage(Args&&... args) : value_{ tl::in_place, std::forward<Args>(args)... } {}

public:
    void incref() & {
        [[maybe_unused]] const std::uint32_t prev = strong_.fetch_add(1, std::memory_order::relaxed);
        DEBUG_ASSERT(prev > 0u);
    }

    // for weak_arc::lock, fails if the value is already gone
    [[nodiscard]] bool try_incref() & {
        std::uint32_t count = strong_.load(std::memory_order::relaxed);
        while (count != 0) {
            if (strong_.compare_exchange_weak(
                    count, count + 1, std::memory_order::acquire, std::memory_order::relaxed
                )) {
                return true;
            }
        }
        return false;
    }

    void decref() & {
        if (strong_.fetch_sub(1, std::memory_order::acq_rel) == 1) {
            value_.reset();
            decref_weak();
        }
    }

    void incref_weak() & { weak_.fetch_add(1, std::memory_order::relaxed); }

    void decref_weak() & {
        if (weak_.fetch_sub(1, std::memory_order::acq_rel) == 1) {
            delete this;
        }
    }

    [[nodiscard]] std::uint32_t use_count() const& { return strong_.load(std::memory_order::relaxed); }

public:
    T& value() & { return *value_; }
    const T& value() const& { return *value_; }

private:
    tl::optional<T> value_;
    alignas(hardware_destructive_interference_size) Atomic<std::uint32_t> strong_{ 1u };
    Atomic<std::uint32_t> weak_{ 1u };
};

} // namespace detail

template <typename T, template <typename> typename Atomic>
struct weak_arc;

template <typename T, template <typename> typename Atomic = detail::atomic>
struct [[nodiscard]] arc {
    using storage_type = detail::arc_storage<T, Atomic>;

private:
    // adopts already counted reference
    explicit arc(storage_type* storage) : storage_{ storage } {}

    friend struct weak_arc<T, Atomic>;

public:
    template <typename... Args>
    static arc make(Args&&... args) {
        return arc{ new storage_type{ std::forward<Args>(args)... } };
    }

public:
    arc(const arc& other) : storage_{ other.storage_ } {
        if (nullptr != storage_) {
            storage_->incref();
        }
    }
    arc(arc&& other) noexcept : storage_{ std::exchange(other.storage_, nullptr) } {}

    arc& operator=(const arc& other) {
        arc{ other }.swap(*this);
        return *this;
    }
    arc& operator=(arc&& other) noexcept {
        arc{ std::move(other) }.swap(*this);
        return *this;
    }

    ~arc() {
        if (nullptr != storage_) {
            storage_->decref();
        }
    }

    void swap(arc& other) noexcept { std::swap(storage_, other.storage_); }

public:
    T& value() const {
        DEBUG_ASSERT(storage_ != nullptr, "use after move");
        return storage_->value();
    }

    T& operator*() const { return value(); }
    T* operator->() const { return &value(); }
    T* get() const { return nullptr == storage_ ? nullptr : &storage_->value(); }

    [[nodiscard]] std::uint32_t use_count() const { return nullptr == storage_ ? 0u : storage_->use_count(); }

    weak_arc<T, Atomic> downgrade() const { return weak_arc<T, Atomic>{ *this }; }

    friend bool operator==(const arc& l, const arc& r) { return l.storage_ == r.storage_; }

private:
    storage_type* storage_;
};

template <typename T, template <typename> typename Atomic = detail::atomic>
struct weak_arc {
    using storage_type = detail::arc_storage<T, Atomic>;

public:
    weak_arc() = default;

    explicit weak_arc(const arc<T, Atomic>& strong) : storage_{ strong.storage_ } {
        if (nullptr != storage_) {
            storage_->incref_weak();
        }
    }

    weak_arc(const weak_arc& other) : storage_{ other.storage_ } {
        if (nullptr != storage_) {
            storage_->incref_weak();
        }
    }
    weak_arc(weak_arc&& other) noexcept : storage_{ std::exchange(other.storage_, nullptr) } {}

    weak_arc& operator=(const weak_arc& other) {
        weak_arc{ other }.swap(*this);
        return *this;
    }
    weak_arc& operator=(weak_arc&& other) noexcept {
        weak_arc{ std::move(other) }.swap(*this);
        return *this;
    }

    ~weak_arc() {
        if (nullptr != storage_) {
            storage_->decref_weak();
        }
    }

    void swap(weak_arc& other) noexcept { std::swap(storage_, other.storage_); }

public:
    meta::maybe<arc<T, Atomic>> lock() const {
        if (nullptr == storage_ || !storage_->try_incref()) {
            return tl::nullopt;
        }
        return arc<T, Atomic>{ storage_ };
    }

    [[nodiscard]] bool expired() const { return nullptr == storage_ || storage_->use_count() == 0u; }

private:
    storage_type* storage_ = nullptr;
};

} // namespace sl::rx
