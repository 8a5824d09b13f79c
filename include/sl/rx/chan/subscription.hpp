//
// Created by usatiynyan.
//
// Per subscriber mailbox.
// Posting pushes to a lock-free stack and bumps work_, the poster that moves work_ from zero schedules the drain.
// Drain takes the whole stack, restores posting order and delivers it, a single drain runs at a time.
//

#pragma once

#include "sl/rx/exec/executor.hpp"
#include "sl/rx/model/buffer_size.hpp"
#include "sl/rx/model/event.hpp"
#include "sl/rx/thread/arc.hpp"
#include "sl/rx/thread/detail/atomic.hpp"
#include "sl/rx/thread/detail/lock_free_stack.hpp"
#include "sl/rx/thread/detail/polyfill.hpp"

#include <sl/meta/intrusive/forward_list.hpp>
#include <sl/meta/monad/maybe.hpp>
#include <sl/meta/traits/unique.hpp>

#include <function2/function2.hpp>
#include <libassert/assert.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace sl::rx {

template <typename UpdateT, typename SuccessT>
class subscription final
    : public task_node
    , meta::immovable {
public:
    using event_type = event<UpdateT, SuccessT>;
    // must not throw, exceptions are the business of whoever built the handler
    using handler_type = fu2::unique_function<void(event_type&&)>;

private:
    struct mail : meta::intrusive_forward_list_node<mail> {
        explicit mail(event_type an_event) : event{ std::move(an_event) } {}

        event_type event;
    };

public:
    subscription(executor& an_executor, buffer_size a_buffer_size, handler_type handler)
        : executor_{ an_executor }, buffer_size_{ a_buffer_size }, handler_{ std::move(handler) } {
        DEBUG_ASSERT(static_cast<bool>(handler_));
    }

    ~subscription() noexcept override { discard(mailbox_.extract()); }

    // self has to own this subscription, it is kept until the scheduled drain is over
    void post(const arc<subscription>& self, event_type an_event) {
        DEBUG_ASSERT(self.get() == this);
        mailbox_.push(new mail{ std::move(an_event) }); // release mail
        if (work_.fetch_add(1, std::memory_order::acq_rel) == 0) {
            keep_alive_.emplace(self);
            executor_.schedule(this);
        }
    }

    // nothing is delivered after this, including what is already in the mailbox
    void tombstone() { tombstoned_.store(true, std::memory_order::release); }
    [[nodiscard]] bool is_tombstoned() const { return tombstoned_.load(std::memory_order::acquire); }

    executor& get_executor() const { return executor_; }

public:
    void execute() noexcept override { drain(/* deliver = */ true); }

    // executor refused to run us, mailbox is emptied without delivery
    void cancel() noexcept override {
        tombstone();
        drain(/* deliver = */ false);
    }

private:
    void drain(bool deliver) noexcept {
        meta::maybe<arc<subscription>> guard = std::exchange(keep_alive_, tl::nullopt);

        auto* head = mailbox_.extract_fifo(); // acquire mail

        std::size_t batch_size = 0;
        std::size_t batch_updates = 0;
        for (auto* node = head; node != nullptr; node = node->intrusive_next) {
            ++batch_size;
            batch_updates += node->downcast()->event.is_update() ? 1 : 0;
        }
        std::size_t to_drop = buffer_size_.overflow(batch_updates);

        while (head != nullptr) {
            std::unique_ptr<mail> current{ head->downcast() };
            head = head->intrusive_next;

            if (!deliver || completed_ || is_tombstoned()) {
                continue;
            }
            if (current->event.is_update() && to_drop > 0) {
                --to_drop;
                continue;
            }
            completed_ = current->event.is_completion();
            handler_(std::move(current->event));
        }

        if ((completed_ || is_tombstoned()) && handler_) {
            handler_ = nullptr; // releases whatever the handler holds
        }

        const std::size_t work_before_batch = work_.fetch_sub(batch_size, std::memory_order::acq_rel);
        if (work_before_batch > batch_size) {
            keep_alive_ = std::move(guard);
            executor_.schedule(this);
        }
        // guard may be the last owner
    }

    static void discard(meta::intrusive_forward_list_node<mail>* head) {
        while (head != nullptr) {
            std::unique_ptr<mail> current{ head->downcast() };
            head = head->intrusive_next;
        }
    }

private:
    executor& executor_;
    buffer_size buffer_size_;
    handler_type handler_;
    bool completed_ = false; // drain only
    meta::maybe<arc<subscription>> keep_alive_{};

    alignas(detail::hardware_destructive_interference_size) detail::lock_free_stack<mail> mailbox_;
    alignas(detail::hardware_destructive_interference_size) detail::atomic<std::size_t> work_{ 0 };
    detail::atomic<bool> tombstoned_{ false };
};

} // namespace sl::rx
