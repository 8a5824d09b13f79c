//
// Created by usatiynyan.
//

#include "sl/rx/cancel/token.hpp"

#include <atomic>
#include <tuple>

namespace sl::rx {
namespace detail {

bool cancellation_entry::try_fire() {
    if (done_.exchange(true, std::memory_order::acq_rel)) {
        return false;
    }
    auto callback = std::move(callback_);
    callback();
    return true;
}

bool cancellation_entry::disarm() {
    if (done_.exchange(true, std::memory_order::acq_rel)) {
        return false;
    }
    callback_ = nullptr;
    return true;
}

} // namespace detail

cancellation_callback::~cancellation_callback() {
    if (!entry_.has_value()) {
        return;
    }
    arc<detail::cancellation_entry>& entry = entry_.value();
    std::ignore = entry->disarm();
    if (auto state = state_.lock()) {
        std::ignore = (*state)->callbacks.update([&entry](const auto& callbacks) {
            return remove_if(callbacks, [&entry](const arc<detail::cancellation_entry>& x) { return x == entry; });
        });
    }
}

bool cancellation_token::is_cancelled() const {
    return state_.has_value() && (*state_)->cancelled.load(std::memory_order::acquire);
}

cancellation_callback cancellation_token::on_cancel(fu2::unique_function<void()> callback) const {
    auto entry = arc<detail::cancellation_entry>::make(std::move(callback));
    if (!state_.has_value()) {
        return cancellation_callback{};
    }
    detail::cancellation_state& state = **state_;
    if (state.cancelled.load(std::memory_order::acquire)) {
        std::ignore = entry->try_fire();
        return cancellation_callback{};
    }

    std::ignore = state.callbacks.update([&entry](const auto& callbacks) { return push_front(callbacks, entry); });

    // pairs with the fence in cancellation_source::cancel
    std::atomic_thread_fence(std::memory_order::seq_cst);
    if (state.cancelled.load(std::memory_order::relaxed)) {
        std::ignore = entry->try_fire();
    }
    return cancellation_callback{ state_->downgrade(), std::move(entry) };
}

bool cancellation_source::cancel() {
    if (state_->cancelled.exchange(true, std::memory_order::acq_rel)) {
        return false;
    }
    std::atomic_thread_fence(std::memory_order::seq_cst);

    const auto callbacks = state_->callbacks.reset();
    for_each(callbacks, [](const arc<detail::cancellation_entry>& entry) { std::ignore = entry->try_fire(); });
    return true;
}

} // namespace sl::rx
