//
// Created by usatiynyan.
//
// Channels of fallible<T> into channels of T, both run on the immediate executor.
// unwrapped: the first failure fails the derived channel.
// unsafely_unwrapped: a failure is a broken precondition.
//

#pragma once

#include "sl/rx/algo/make_producer.hpp"
#include "sl/rx/exec/immediate.hpp"

#include <libassert/assert.hpp>

#include <exception>
#include <tuple>
#include <utility>

namespace sl::rx {
namespace detail {

struct rethrow_failure {
    template <typename InvokerT, Fallible ValueT, typename ProducerT>
    void operator()(InvokerT, ValueT&& value, ProducerT& derived) const {
        if (!value.has_value()) {
            std::rethrow_exception(std::move(value).error());
        }
        std::ignore = derived.update(std::move(value).value());
    }
};

struct assume_success {
    template <typename InvokerT, Fallible ValueT, typename ProducerT>
    void operator()(InvokerT, ValueT&& value, ProducerT& derived) const {
        ASSERT(value.has_value(), "unsafely_unwrapped got a failure");
        std::ignore = derived.update(std::move(value).value());
    }
};

template <typename ContextT, typename OnUpdateT>
struct [[nodiscard]] unwrap {
    template <SomeChannel ChannelT>
        requires Fallible<typename ChannelT::update_type>
    auto operator()(const ChannelT& source) && {
        using update_type = typename ChannelT::update_type::value_type;
        using success_type = typename ChannelT::success_type;

        options.on_executor = &immediate_executor();
        return make_pipeline<update_type, success_type>(
            source,
            std::move(context),
            std::move(options),
            completion_passthrough<OnUpdateT, success_type>{ OnUpdateT{} }
        );
    }

    ContextT context;
    derived_options options;
};

} // namespace detail

inline auto unwrapped(derived_options options = {}) {
    return detail::unwrap<detail::no_context, detail::rethrow_failure>{ {}, std::move(options) };
}

template <ExecutionContext ContextT>
auto unwrapped(const arc<ContextT>& context, derived_options options = {}) {
    return detail::unwrap<detail::weak_context<ContextT>, detail::rethrow_failure>{
        detail::weak_context<ContextT>{ context },
        std::move(options),
    };
}

inline auto unsafely_unwrapped(derived_options options = {}) {
    return detail::unwrap<detail::no_context, detail::assume_success>{ {}, std::move(options) };
}

template <ExecutionContext ContextT>
auto unsafely_unwrapped(const arc<ContextT>& context, derived_options options = {}) {
    return detail::unwrap<detail::weak_context<ContextT>, detail::assume_success>{
        detail::weak_context<ContextT>{ context },
        std::move(options),
    };
}

} // namespace sl::rx
