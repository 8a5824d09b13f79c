//
// Created by usatiynyan.
//

#pragma once

#include <sl/meta/monad/result.hpp>

#include <libassert/assert.hpp>

#include <concepts>
#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace sl::rx {

template <typename T>
using fallible = meta::result<T, std::exception_ptr>;

template <typename T>
concept Fallible = requires {
    typename T::value_type;
    typename T::error_type;
} && std::same_as<T, fallible<typename T::value_type>>;

template <typename SuccessT>
class completion {
    struct cancelled_tag {};
    using state_type = std::variant<SuccessT, std::exception_ptr, cancelled_tag>;

    explicit completion(state_type state) : state_{ std::move(state) } {}

public:
    using success_type = SuccessT;

    static completion success(SuccessT value) {
        return completion{ state_type{ std::in_place_index<0>, std::move(value) } };
    }
    static completion failure(std::exception_ptr error) {
        DEBUG_ASSERT(error != nullptr);
        return completion{ state_type{ std::in_place_index<1>, std::move(error) } };
    }
    static completion cancelled() { return completion{ state_type{ std::in_place_index<2> } }; }

public:
    [[nodiscard]] bool is_success() const { return state_.index() == 0; }
    [[nodiscard]] bool is_failure() const { return state_.index() == 1; }
    [[nodiscard]] bool is_cancelled() const { return state_.index() == 2; }

    SuccessT& value() & {
        ASSERT(is_success());
        return std::get<0>(state_);
    }
    const SuccessT& value() const& {
        ASSERT(is_success());
        return std::get<0>(state_);
    }
    SuccessT&& value() && {
        ASSERT(is_success());
        return std::get<0>(std::move(state_));
    }

    const std::exception_ptr& error() const {
        ASSERT(is_failure());
        return std::get<1>(state_);
    }

    // keeps failure and cancellation, maps success
    template <typename F>
    auto map(F&& f) && -> completion<std::invoke_result_t<F, SuccessT&&>> {
        using mapped_type = completion<std::invoke_result_t<F, SuccessT&&>>;
        switch (state_.index()) {
        case 0:
            return mapped_type::success(std::forward<F>(f)(std::get<0>(std::move(state_))));
        case 1:
            return mapped_type::failure(std::get<1>(std::move(state_)));
        default:
            return mapped_type::cancelled();
        }
    }

private:
    state_type state_;
};

template <typename UpdateT, typename SuccessT>
class event {
    using state_type = std::variant<UpdateT, completion<SuccessT>>;

    explicit event(state_type state) : state_{ std::move(state) } {}

public:
    using update_type = UpdateT;
    using success_type = SuccessT;
    using completion_type = completion<SuccessT>;

    static event from_update(UpdateT value) { return event{ state_type{ std::in_place_index<0>, std::move(value) } }; }
    static event from_completion(completion_type value) {
        return event{ state_type{ std::in_place_index<1>, std::move(value) } };
    }

public:
    [[nodiscard]] bool is_update() const { return state_.index() == 0; }
    [[nodiscard]] bool is_completion() const { return state_.index() == 1; }

    UpdateT& update() & {
        ASSERT(is_update());
        return std::get<0>(state_);
    }
    const UpdateT& update() const& {
        ASSERT(is_update());
        return std::get<0>(state_);
    }
    UpdateT&& update() && {
        ASSERT(is_update());
        return std::get<0>(std::move(state_));
    }

    completion_type& get_completion() & {
        ASSERT(is_completion());
        return std::get<1>(state_);
    }
    const completion_type& get_completion() const& {
        ASSERT(is_completion());
        return std::get<1>(state_);
    }
    completion_type&& get_completion() && {
        ASSERT(is_completion());
        return std::get<1>(std::move(state_));
    }

private:
    state_type state_;
};

} // namespace sl::rx
