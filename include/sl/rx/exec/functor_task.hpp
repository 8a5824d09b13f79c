//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/exec/executor.hpp"

#include <new>
#include <type_traits>
#include <utility>

namespace sl::rx {

template <typename F>
concept FunctorTask = std::is_nothrow_invocable_r_v<void, F&>;

template <FunctorTask F>
class functor_task_node final : public task_node {
public:
    template <typename FV>
    explicit functor_task_node(FV&& f) : f_{ std::forward<FV>(f) } {}

    void execute() noexcept override {
        f_();
        delete this;
    }

    void cancel() noexcept override { delete this; }

private:
    F f_;
};

template <typename FV>
    requires FunctorTask<std::decay_t<FV>>
void schedule(executor& executor, FV&& f) {
    auto* node = new (std::nothrow) functor_task_node<std::decay_t<FV>>{ std::forward<FV>(f) };
    executor.schedule(node);
}

} // namespace sl::rx
