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
struct [[nodiscard]] map {
    template <SomeChannel ChannelT>
    auto operator()(const ChannelT& source) && {
        using update_type = typename ContextT::template result_t<F, typename ChannelT::update_type&&>;
        using success_type = typename ChannelT::success_type;

        auto on_update = [f = std::move(functor)](auto call, auto&& value, producer<update_type, success_type>& derived
                         ) mutable { std::ignore = derived.update(call(f, std::move(value))); };
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

// f(update) -> new update, completion is passed as is
template <typename F>
auto map(F functor, derived_options options = {}) {
    return detail::map<detail::no_context, F>{ {}, std::move(functor), std::move(options) };
}

// f(context&, update) -> new update
template <ExecutionContext ContextT, typename F>
auto map(const arc<ContextT>& context, F functor, derived_options options = {}) {
    return detail::map<detail::weak_context<ContextT>, F>{
        detail::weak_context<ContextT>{ context },
        std::move(functor),
        std::move(options),
    };
}

} // namespace sl::rx
