//
// Created by usatiynyan.
//
// example of "endless" execution, while tasks are coming:
// ```cpp
// while (manual_executor.execute_batch() > 0) {
//     // spin
// }
// ```
// not thread-safe, meant for a single thread driving everything (tests, event loops)
//

#pragma once

#include "sl/rx/exec/executor.hpp"

#include <cstddef>

namespace sl::rx {

class manual_executor final : public executor {
public:
    ~manual_executor() noexcept override;

    void schedule(task_node* task_node) noexcept override;
    void stop() noexcept override;

    // execute finite batch of currently scheduled tasks
    std::size_t execute_batch() noexcept;

    // less optimal then execute_batch
    std::size_t execute_at_most(std::size_t n) noexcept;

    // until nothing is scheduled
    std::size_t execute_all() noexcept;

    [[nodiscard]] bool empty() const noexcept { return task_queue_.empty(); }

private:
    task_list task_queue_;
};

} // namespace sl::rx
