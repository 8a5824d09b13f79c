//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/algo/make_producer.hpp"

#include <tuple>
#include <utility>

namespace sl::rx {
namespace detail {

template <typename ContextT, typename F>
struct [[nodiscard]] filter {
    template <SomeChannel ChannelT>
    auto operator()(const ChannelT& source) && {
        using update_type = typename ChannelT::update_type;
        using success_type = typename ChannelT::success_type;

        auto on_update = [f = std::move(functor)](auto call, auto&& value, producer<update_type, success_type>& derived
                         ) mutable {
            if (call(f, std::as_const(value))) {
                std::ignore = derived.update(std::move(value));
            }
        };
        return make_pipeline<update_type, success_type>(
            source,
            std::move(context),
            std::move(options),
            completion_passthrough<decltype(on_update), success_type>{ std::move(on_update) }
        );
    }

    ContextT context;
    F functor;
    derived_options options;
};

} // namespace detail

// predicate(const update&) -> bool
template <typename F>
auto filter(F predicate, derived_options options = {}) {
    return detail::filter<detail::no_context, F>{ {}, std::move(predicate), std::move(options) };
}

template <ExecutionContext ContextT, typename F>
auto filter(const arc<ContextT>& context, F predicate, derived_options options = {}) {
    return detail::filter<detail::weak_context<ContextT>, F>{
        detail::weak_context<ContextT>{ context },
        std::move(predicate),
        std::move(options),
    };
}

} // namespace sl::rx
