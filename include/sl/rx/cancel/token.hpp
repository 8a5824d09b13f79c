//
// Created by usatiynyan.
//
// Cooperative cancellation.
// cancellation_source owns the right to cancel, cancellation_token-s observe it and register callbacks.
//

#pragma once

#include "sl/rx/slot/atomic_slot.hpp"
#include "sl/rx/slot/persistent_list.hpp"
#include "sl/rx/thread/arc.hpp"
#include "sl/rx/thread/detail/atomic.hpp"

#include <sl/meta/monad/maybe.hpp>
#include <sl/meta/traits/unique.hpp>

#include <function2/function2.hpp>

#include <utility>

namespace sl::rx {
namespace detail {

struct cancellation_entry : meta::immovable {
    explicit cancellation_entry(fu2::unique_function<void()> callback) : callback_{ std::move(callback) } {}

    // whoever comes first, fire or disarm, wins
    bool try_fire();
    bool disarm();

private:
    fu2::unique_function<void()> callback_;
    detail::atomic<bool> done_{ false };
};

struct cancellation_state : meta::immovable {
    detail::atomic<bool> cancelled{ false };
    atomic_slot<persistent_list_node<arc<cancellation_entry>>> callbacks;
};

} // namespace detail

// deregisters on destruction, callback is guaranteed not to start after that
class [[nodiscard]] cancellation_callback {
    friend class cancellation_token;

    cancellation_callback(weak_arc<detail::cancellation_state> state, arc<detail::cancellation_entry> entry)
        : state_{ std::move(state) }, entry_{ std::move(entry) } {}

public:
    cancellation_callback() = default;
    cancellation_callback(cancellation_callback&& other) noexcept
        : state_{ std::move(other.state_) }, entry_{ std::exchange(other.entry_, tl::nullopt) } {}
    cancellation_callback& operator=(cancellation_callback&& other) noexcept {
        cancellation_callback{ std::move(other) }.swap(*this);
        return *this;
    }
    cancellation_callback(const cancellation_callback&) = delete;
    cancellation_callback& operator=(const cancellation_callback&) = delete;
    ~cancellation_callback();

    void swap(cancellation_callback& other) noexcept {
        state_.swap(other.state_);
        std::swap(entry_, other.entry_);
    }

    [[nodiscard]] bool is_registered() const { return entry_.has_value(); }

private:
    weak_arc<detail::cancellation_state> state_;
    meta::maybe<arc<detail::cancellation_entry>> entry_;
};

class cancellation_token {
    friend class cancellation_source;

    explicit cancellation_token(arc<detail::cancellation_state> state) : state_{ std::move(state) } {}

public:
    // never cancelled
    cancellation_token() = default;

    [[nodiscard]] bool is_cancelled() const;
    [[nodiscard]] bool can_be_cancelled() const { return state_.has_value(); }

    // callback runs exactly once: right away if already cancelled, otherwise on the thread calling cancel
    cancellation_callback on_cancel(fu2::unique_function<void()> callback) const;

private:
    meta::maybe<arc<detail::cancellation_state>> state_;
};

class cancellation_source {
public:
    cancellation_source() : state_{ arc<detail::cancellation_state>::make() } {}

    [[nodiscard]] cancellation_token token() const { return cancellation_token{ state_ }; }

    // true only for the call that actually cancelled
    bool cancel();
    [[nodiscard]] bool is_cancelled() const { return state_->cancelled.load(std::memory_order::acquire); }

private:
    arc<detail::cancellation_state> state_;
};

} // namespace sl::rx
