//
// Created by usatiynyan.
//
// producer - write side, channel - read side, both share one producer_core.
// Subscriber list is a persistent list inside an atomic_slot: readers take a snapshot, writers rebuild.
//

#pragma once

#include "sl/rx/chan/subscription.hpp"
#include "sl/rx/exec/executor.hpp"
#include "sl/rx/exec/immediate.hpp"
#include "sl/rx/model/buffer_size.hpp"
#include "sl/rx/model/event.hpp"
#include "sl/rx/slot/atomic_slot.hpp"
#include "sl/rx/slot/persistent_list.hpp"
#include "sl/rx/thread/arc.hpp"
#include "sl/rx/thread/detail/atomic.hpp"

#include <sl/meta/monad/maybe.hpp>
#include <sl/meta/traits/unique.hpp>
#include <sl/meta/type/unit.hpp>

#include <atomic>
#include <concepts>
#include <cstdint>
#include <exception>
#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>

namespace sl::rx {

struct subscribe_options {
    executor* on_executor = nullptr; // immediate when not set
    buffer_size buffer = buffer_size::unlimited();
};

namespace detail {

enum class producer_state : std::uint8_t {
    active,
    completing,
    completed,
};

template <typename UpdateT, typename SuccessT>
struct producer_core : meta::immovable {
    using subscription_type = subscription<UpdateT, SuccessT>;
    using event_type = event<UpdateT, SuccessT>;
    using completion_type = completion<SuccessT>;

public:
    bool update(const UpdateT& value) {
        if (state_.load(std::memory_order::acquire) != producer_state::active) {
            return false;
        }
        const auto subscribers = subscribers_.head();
        for_each(subscribers, [&value](const arc<subscription_type>& a_subscription) {
            if (!a_subscription->is_tombstoned()) {
                a_subscription->post(a_subscription, event_type::from_update(value));
            }
        });
        return true;
    }

    bool complete(completion_type a_completion) {
        producer_state expected = producer_state::active;
        if (!state_.compare_exchange_strong(
                expected, producer_state::completing, std::memory_order::acq_rel, std::memory_order::relaxed
            )) {
            return false;
        }
        completion_.emplace(std::move(a_completion));
        state_.store(producer_state::completed, std::memory_order::release);

        // pairs with the fence in attach
        std::atomic_thread_fence(std::memory_order::seq_cst);

        const auto subscribers = subscribers_.reset();
        for_each(subscribers, [this](const arc<subscription_type>& a_subscription) {
            if (!a_subscription->is_tombstoned()) {
                a_subscription->post(a_subscription, event_type::from_completion(*completion_));
            }
        });
        return true;
    }

    void attach(const arc<subscription_type>& a_subscription) {
        std::ignore = subscribers_.update([&a_subscription](const auto& subscribers) {
            return push_front(subscribers, a_subscription);
        });

        // pairs with the fence in complete
        std::atomic_thread_fence(std::memory_order::seq_cst);

        if (state_.load(std::memory_order::acquire) == producer_state::completed) {
            a_subscription->post(a_subscription, event_type::from_completion(*completion_));
            detach(a_subscription);
        }
    }

    void detach(const arc<subscription_type>& a_subscription) {
        std::ignore = subscribers_.update([&a_subscription](const auto& subscribers) {
            return remove_if(subscribers, [&a_subscription](const arc<subscription_type>& x) {
                return x == a_subscription;
            });
        });
    }

    [[nodiscard]] bool is_completed() const {
        return state_.load(std::memory_order::acquire) != producer_state::active;
    }

    [[nodiscard]] meta::maybe<completion_type> get_completion() const {
        if (state_.load(std::memory_order::acquire) != producer_state::completed) {
            return tl::nullopt;
        }
        return *completion_;
    }

    [[nodiscard]] std::size_t subscribers_count() const {
        std::size_t count = 0;
        for_each(subscribers_.head(), [&count](const arc<subscription_type>&) { ++count; });
        return count;
    }

private:
    atomic_slot<persistent_list_node<arc<subscription_type>>> subscribers_;
    detail::atomic<producer_state> state_{ producer_state::active };
    meta::maybe<completion_type> completion_{};
};

} // namespace detail

// doesn't own anything, safe to use after the producer or the subscription are gone
template <typename UpdateT, typename SuccessT>
class registration {
    using core_type = detail::producer_core<UpdateT, SuccessT>;
    using subscription_type = subscription<UpdateT, SuccessT>;

public:
    registration() = default;
    registration(weak_arc<core_type> core, weak_arc<subscription_type> a_subscription)
        : core_{ std::move(core) }, subscription_{ std::move(a_subscription) } {}

    // idempotent
    void unsubscribe() {
        auto a_subscription = subscription_.lock();
        if (!a_subscription.has_value()) {
            return;
        }
        (*a_subscription)->tombstone();
        if (auto core = core_.lock()) {
            (*core)->detach(*a_subscription);
        }
    }

    [[nodiscard]] bool is_active() const {
        auto a_subscription = subscription_.lock();
        return a_subscription.has_value() && !(*a_subscription)->is_tombstoned();
    }

private:
    weak_arc<core_type> core_;
    weak_arc<subscription_type> subscription_;
};

template <typename UpdateT, typename SuccessT = meta::unit>
class channel {
    using core_type = detail::producer_core<UpdateT, SuccessT>;

public:
    using update_type = UpdateT;
    using success_type = SuccessT;
    using event_type = event<UpdateT, SuccessT>;
    using completion_type = completion<SuccessT>;
    using subscription_type = subscription<UpdateT, SuccessT>;
    using handler_type = typename subscription_type::handler_type;
    using registration_type = registration<UpdateT, SuccessT>;

public:
    explicit channel(arc<core_type> core) : core_{ std::move(core) } {}

    // sees events from now on, or only the completion if there was one already
    registration_type subscribe(handler_type handler, subscribe_options options = {}) const {
        auto a_subscription = make_subscription(std::move(handler), options);
        auto a_registration = make_registration(a_subscription);
        attach(a_subscription);
        return a_registration;
    }

    // subscribe split in two, so that the registration exists before the first event arrives
    arc<subscription_type> make_subscription(handler_type handler, subscribe_options options = {}) const {
        executor& an_executor = options.on_executor != nullptr ? *options.on_executor : immediate_executor();
        return arc<subscription_type>::make(an_executor, options.buffer, std::move(handler));
    }
    registration_type make_registration(const arc<subscription_type>& a_subscription) const {
        return registration_type{ core_.downgrade(), a_subscription.downgrade() };
    }
    void attach(const arc<subscription_type>& a_subscription) const { core_->attach(a_subscription); }

    [[nodiscard]] bool is_completed() const { return core_->is_completed(); }
    [[nodiscard]] meta::maybe<completion_type> get_completion() const { return core_->get_completion(); }
    [[nodiscard]] std::size_t subscribers_count() const { return core_->subscribers_count(); }

private:
    arc<core_type> core_;
};

template <typename ChannelT>
concept SomeChannel = requires {
    typename ChannelT::update_type;
    typename ChannelT::success_type;
} && std::same_as<ChannelT, channel<typename ChannelT::update_type, typename ChannelT::success_type>>;

template <typename UpdateT, typename SuccessT = meta::unit>
class producer {
    using core_type = detail::producer_core<UpdateT, SuccessT>;

public:
    using update_type = UpdateT;
    using success_type = SuccessT;
    using completion_type = completion<SuccessT>;
    using channel_type = channel<UpdateT, SuccessT>;

public:
    producer() : core_{ arc<core_type>::make() } {}

    // every call returns false once completed
    bool update(const UpdateT& value) { return core_->update(value); }

    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, const UpdateT&>
    std::size_t update_all(R&& values) {
        std::size_t count = 0;
        for (auto&& value : values) {
            if (!core_->update(value)) {
                break;
            }
            ++count;
        }
        return count;
    }

    // only the first one wins
    bool complete(completion_type a_completion) { return core_->complete(std::move(a_completion)); }
    bool succeed(SuccessT value) { return complete(completion_type::success(std::move(value))); }
    bool fail(std::exception_ptr error) { return complete(completion_type::failure(std::move(error))); }
    template <typename ErrorT>
        requires(!std::same_as<std::decay_t<ErrorT>, std::exception_ptr>)
    bool fail(ErrorT&& error) {
        return fail(std::make_exception_ptr(std::forward<ErrorT>(error)));
    }
    bool cancel() { return complete(completion_type::cancelled()); }

    // sugar over update and complete
    void apply(event<UpdateT, SuccessT>&& an_event) {
        if (an_event.is_update()) {
            std::ignore = update(std::move(an_event).update());
        } else {
            std::ignore = complete(std::move(an_event).get_completion());
        }
    }

    [[nodiscard]] bool is_completed() const { return core_->is_completed(); }
    [[nodiscard]] meta::maybe<completion_type> get_completion() const { return core_->get_completion(); }

    channel_type get_channel() const { return channel_type{ core_ }; }

private:
    arc<core_type> core_;
};

} // namespace sl::rx
