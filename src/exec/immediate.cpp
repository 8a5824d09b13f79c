//
// Created by usatiynyan.
//

#include "sl/rx/exec/immediate.hpp"

#include <libassert/assert.hpp>

namespace sl::rx {
namespace {

struct trampoline {
    task_list pending;
    bool running = false;
};

thread_local trampoline local_trampoline;

} // namespace

void inline_executor::schedule(task_node* task_node) noexcept {
    if (!ASSUME_VAL(task_node != nullptr)) {
        return;
    }
    trampoline& a_trampoline = local_trampoline;
    a_trampoline.pending.push_back(task_node);
    if (a_trampoline.running) {
        return;
    }

    a_trampoline.running = true;
    // task may delete itself, so unlink before executing
    while (auto* node = a_trampoline.pending.pop_front()) {
        node->downcast()->execute();
    }
    a_trampoline.running = false;
}

} // namespace sl::rx
