//
// Created by usatiynyan.
//

#include "sl/rx/exec/manual.hpp"

#include <libassert/assert.hpp>

namespace sl::rx {

manual_executor::~manual_executor() noexcept {
    if (!ASSUME_VAL(task_queue_.empty(), "executor destroyed with unfinished tasks", task_queue_.size())) {
        stop();
    }
}

void manual_executor::schedule(task_node* task_node) noexcept {
    if (ASSUME_VAL(task_node != nullptr)) {
        task_queue_.push_back(task_node);
    }
}

void manual_executor::stop() noexcept {
    task_list batch = std::move(task_queue_);
    while (auto* node = batch.pop_front()) {
        node->downcast()->cancel();
    }
}

std::size_t manual_executor::execute_batch() noexcept {
    task_list batch = std::move(task_queue_); // clears task_queue_
    std::size_t counter = 0;
    // task may delete itself, so unlink before executing
    while (auto* node = batch.pop_front()) {
        node->downcast()->execute();
        ++counter;
    }
    return counter;
}

std::size_t manual_executor::execute_at_most(std::size_t n) noexcept {
    std::size_t counter = 0;
    for (; counter != n; ++counter) {
        auto* node = task_queue_.pop_front();
        if (node == nullptr) {
            break;
        }
        node->downcast()->execute();
    }
    return counter;
}

std::size_t manual_executor::execute_all() noexcept {
    std::size_t total = 0;
    while (const std::size_t executed = execute_batch()) {
        total += executed;
    }
    return total;
}

} // namespace sl::rx
