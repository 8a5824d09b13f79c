//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/exec/task.hpp"

namespace sl::rx {

// schedule either executes the task eventually or cancels it, exactly one of the two
struct executor {
    virtual ~executor() noexcept = default;
    virtual void schedule(task_node* task_node) noexcept = 0;
    virtual void stop() noexcept = 0;
};

} // namespace sl::rx
