//
// Created by usatiynyan.
//
// flat_map dispatches on what f returns:
// - meta::maybe<P> - nullopt is skipped, otherwise forwarded
// - range of P - every element is forwarded, in order, before the next update is handled
//

#pragma once

#include "sl/rx/algo/make_producer.hpp"

#include <sl/meta/monad/maybe.hpp>

#include <ranges>
#include <tuple>
#include <type_traits>
#include <utility>

namespace sl::rx {
namespace detail {

template <typename T>
struct is_maybe : std::false_type {};

template <typename T>
struct is_maybe<meta::maybe<T>> : std::true_type {};

template <typename T>
struct flat_map_traits;

template <typename T>
    requires is_maybe<T>::value
struct flat_map_traits<T> {
    using update_type = typename T::value_type;

    template <typename ProducerT>
    static void forward(T&& maybe_value, ProducerT& derived) {
        if (maybe_value.has_value()) {
            std::ignore = derived.update(std::move(maybe_value).value());
        }
    }
};

template <typename T>
    requires(!is_maybe<T>::value) && std::ranges::input_range<T>
struct flat_map_traits<T> {
    using update_type = std::ranges::range_value_t<T>;

    template <typename ProducerT>
    static void forward(T&& values, ProducerT& derived) {
        std::ignore = derived.update_all(values);
    }
};

template <typename ContextT, typename F>
struct [[nodiscard]] flat_map {
    template <SomeChannel ChannelT>
    auto operator()(const ChannelT& source) && {
        using result_type = typename ContextT::template result_t<F, typename ChannelT::update_type&&>;
        using traits = flat_map_traits<std::remove_cvref_t<result_type>>;
        using update_type = typename traits::update_type;
        using success_type = typename ChannelT::success_type;

        auto on_update = [f = std::move(functor)](auto call, auto&& value, producer<update_type, success_type>& derived
                         ) mutable { traits::forward(call(f, std::move(value)), derived); };
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

template <typename F>
auto flat_map(F functor, derived_options options = {}) {
    return detail::flat_map<detail::no_context, F>{ {}, std::move(functor), std::move(options) };
}

template <ExecutionContext ContextT, typename F>
auto flat_map(const arc<ContextT>& context, F functor, derived_options options = {}) {
    return detail::flat_map<detail::weak_context<ContextT>, F>{
        detail::weak_context<ContextT>{ context },
        std::move(functor),
        std::move(options),
    };
}

} // namespace sl::rx
