//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/algo/make_producer.hpp"

#include <type_traits>
#include <utility>

namespace sl::rx {
namespace detail {

template <typename ContextT, typename F>
struct [[nodiscard]] map_event {
    template <SomeChannel ChannelT>
    auto operator()(const ChannelT& source) && {
        using result_type =
            std::remove_cvref_t<typename ContextT::template result_t<F, typename ChannelT::event_type&&>>;
        using update_type = typename result_type::update_type;
        using success_type = typename result_type::success_type;
        static_assert(std::is_same_v<result_type, event<update_type, success_type>>, "f has to return an event");

        return make_pipeline<update_type, success_type>(
            source,
            std::move(context),
            std::move(options),
            [f = std::move(functor)](
                auto call, auto&& an_event, producer<update_type, success_type>& derived, executor&
            ) mutable { derived.apply(call(f, std::move(an_event))); }
        );
    }

    ContextT context;
    F functor;
    derived_options options;
};

} // namespace detail

// f(event) -> event, updates and the completion alike
template <typename F>
auto map_event(F functor, derived_options options = {}) {
    return detail::map_event<detail::no_context, F>{ {}, std::move(functor), std::move(options) };
}

template <ExecutionContext ContextT, typename F>
auto map_event(const arc<ContextT>& context, F functor, derived_options options = {}) {
    return detail::map_event<detail::weak_context<ContextT>, F>{
        detail::weak_context<ContextT>{ context },
        std::move(functor),
        std::move(options),
    };
}

} // namespace sl::rx
