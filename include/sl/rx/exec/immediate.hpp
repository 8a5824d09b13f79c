//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/exec/executor.hpp"

namespace sl::rx {

// runs the task right away on the calling thread
// a task scheduled from inside a running task is queued and runs right after it, so the stack stays flat
class inline_executor final : public executor {
public:
    static inline_executor& instance() {
        static inline_executor instance;
        return instance;
    }

    void schedule(task_node* task_node) noexcept override;
    void stop() noexcept override {}
};

inline executor& immediate_executor() { return inline_executor::instance(); }

} // namespace sl::rx
