//
// Created by usatiynyan.
//
// Derived channel fed by a body invoked once per source event, serialized by the pipeline's own subscription.
// Per event, in order:
// - derived channel is already completed -> dropped
// - cancellation token is cancelled -> derived is cancelled
// - bound context is gone -> derived is cancelled, completion events included
// - otherwise the body runs, an exception escaping it fails the derived channel
// Once the derived channel is completed the pipeline unsubscribes from the source.
//

#pragma once

#include "sl/rx/cancel/token.hpp"
#include "sl/rx/chan/producer.hpp"
#include "sl/rx/exec/executor.hpp"
#include "sl/rx/exec/primary.hpp"
#include "sl/rx/model/buffer_size.hpp"
#include "sl/rx/model/context.hpp"
#include "sl/rx/model/event.hpp"
#include "sl/rx/thread/arc.hpp"

#include <sl/meta/traits/unique.hpp>
#include <sl/meta/type/unit.hpp>

#include <exception>
#include <tuple>
#include <type_traits>
#include <utility>

namespace sl::rx {

struct derived_options {
    executor* on_executor = nullptr; // context's executor, or primary_executor() without a context
    cancellation_token token{};
    buffer_size buffer = buffer_size::default_size();
};

namespace detail {

struct direct_invoker {
    template <typename F, typename... Args>
    decltype(auto) operator()(F& f, Args&&... args) const {
        return f(std::forward<Args>(args)...);
    }
};

template <ExecutionContext ContextT>
struct context_invoker {
    template <typename F, typename... Args>
    decltype(auto) operator()(F& f, Args&&... args) const {
        return f(context, std::forward<Args>(args)...);
    }

    ContextT& context;
};

struct no_context {
    template <typename F, typename... Args>
    using result_t = std::invoke_result_t<F&, Args...>;

    executor& default_executor() const { return primary_executor(); }

    template <typename BodyT, typename... Args>
    bool invoke(BodyT& body, Args&&... args) const {
        body(direct_invoker{}, std::forward<Args>(args)...);
        return true;
    }
};

// the context is held strongly only for the duration of a single body invocation
template <ExecutionContext ContextT>
struct weak_context {
    template <typename F, typename... Args>
    using result_t = std::invoke_result_t<F&, ContextT&, Args...>;

    explicit weak_context(const arc<ContextT>& context) : context_{ context.downgrade() } {}

    // is kept by the pipeline past the context, see ExecutionContext
    executor& default_executor() const {
        if (auto context = context_.lock()) {
            return (*context)->get_executor();
        }
        return primary_executor();
    }

    template <typename BodyT, typename... Args>
    bool invoke(BodyT& body, Args&&... args) const {
        auto context = context_.lock();
        if (!context.has_value()) {
            return false;
        }
        body(context_invoker<ContextT>{ **context }, std::forward<Args>(args)...);
        return true;
    }

private:
    weak_arc<ContextT> context_;
};

template <typename SourceUpdateT, typename SourceSuccessT, typename UpdateT, typename SuccessT, typename ContextT, typename BodyT>
class pipeline : meta::immovable {
public:
    using source_event_type = event<SourceUpdateT, SourceSuccessT>;
    using producer_type = producer<UpdateT, SuccessT>;
    using registration_type = registration<SourceUpdateT, SourceSuccessT>;

public:
    pipeline(ContextT context, BodyT body, cancellation_token token)
        : context_{ std::move(context) }, body_{ std::move(body) }, token_{ std::move(token) } {}

    // nobody is going to feed the derived channel anymore
    ~pipeline() { std::ignore = derived_.cancel(); }

    void on_event(source_event_type&& an_event, executor& origin) noexcept {
        if (derived_.is_completed()) {
            registration_.unsubscribe();
            return;
        }
        if (token_.is_cancelled()) {
            on_cancelled();
            return;
        }

        try {
            if (!context_.invoke(body_, std::move(an_event), derived_, origin)) {
                std::ignore = derived_.cancel();
            }
        } catch (...) {
            std::ignore = derived_.fail(std::current_exception());
        }

        if (derived_.is_completed()) {
            registration_.unsubscribe();
        }
    }

    void on_cancelled() {
        std::ignore = derived_.cancel();
        registration_.unsubscribe();
    }

    producer_type& get_derived() { return derived_; }

    // both are set before the pipeline becomes reachable from other threads
    void set_registration(registration_type a_registration) { registration_ = std::move(a_registration); }
    void set_cancellation_callback(cancellation_callback callback) { cancellation_callback_ = std::move(callback); }

private:
    ContextT context_;
    BodyT body_;
    cancellation_token token_;
    producer_type derived_{};
    registration_type registration_{};
    cancellation_callback cancellation_callback_{};
};

// body: (invoker, event&&, producer&, executor& origin), invoker(f, args...) calls f with the context prepended, if bound
template <typename UpdateT, typename SuccessT, SomeChannel ChannelT, typename ContextT, typename BodyT>
channel<UpdateT, SuccessT> make_pipeline(const ChannelT& source, ContextT context, derived_options options, BodyT body) {
    using source_update_type = typename ChannelT::update_type;
    using source_success_type = typename ChannelT::success_type;
    using pipeline_type = pipeline<source_update_type, source_success_type, UpdateT, SuccessT, ContextT, BodyT>;

    executor& an_executor = options.on_executor != nullptr ? *options.on_executor : context.default_executor();

    auto a_pipeline = arc<pipeline_type>::make(std::move(context), std::move(body), options.token);
    channel<UpdateT, SuccessT> derived = a_pipeline->get_derived().get_channel();

    auto a_subscription = source.make_subscription(
        [a_pipeline, origin = &an_executor](typename ChannelT::event_type&& an_event) {
            a_pipeline->on_event(std::move(an_event), *origin);
        },
        subscribe_options{
            .on_executor = &an_executor,
            .buffer = options.buffer,
        }
    );
    a_pipeline->set_registration(source.make_registration(a_subscription));
    source.attach(a_subscription);

    if (options.token.can_be_cancelled()) {
        a_pipeline->set_cancellation_callback(options.token.on_cancel([weak_pipeline = a_pipeline.downgrade()] {
            if (auto strong_pipeline = weak_pipeline.lock()) {
                (*strong_pipeline)->on_cancelled();
            }
        }));
    }
    return derived;
}

template <typename F, typename SuccessT>
struct completion_passthrough {
    F functor;

    template <typename InvokerT, typename UpdateT, typename ProducerT>
    void operator()(InvokerT call, event<UpdateT, SuccessT>&& an_event, ProducerT& derived, executor&) {
        if (an_event.is_update()) {
            functor(call, std::move(an_event).update(), derived);
        } else {
            std::ignore = derived.complete(std::move(an_event).get_completion());
        }
    }
};

} // namespace detail

// body(event&&, producer<UpdateT, SuccessT>&, executor& origin)
template <typename UpdateT, typename SuccessT, SomeChannel ChannelT, typename BodyT>
channel<UpdateT, SuccessT> make_producer(const ChannelT& source, derived_options options, BodyT body) {
    return detail::make_pipeline<UpdateT, SuccessT>(
        source,
        detail::no_context{},
        std::move(options),
        [body = std::move(body)](auto call, auto&& an_event, producer<UpdateT, SuccessT>& derived, executor& origin) mutable {
            call(body, std::move(an_event), derived, origin);
        }
    );
}

// body(ContextT&, event&&, producer<UpdateT, SuccessT>&, executor& origin)
template <typename UpdateT, typename SuccessT, SomeChannel ChannelT, ExecutionContext ContextT, typename BodyT>
channel<UpdateT, SuccessT>
    make_producer(const ChannelT& source, const arc<ContextT>& context, derived_options options, BodyT body) {
    return detail::make_pipeline<UpdateT, SuccessT>(
        source,
        detail::weak_context<ContextT>{ context },
        std::move(options),
        [body = std::move(body)](auto call, auto&& an_event, producer<UpdateT, SuccessT>& derived, executor& origin) mutable {
            call(body, std::move(an_event), derived, origin);
        }
    );
}

} // namespace sl::rx
