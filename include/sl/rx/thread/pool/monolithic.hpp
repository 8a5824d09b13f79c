//
// Created by usatiynyan.
//
// single shared queue, every worker pops from it
//

#pragma once

#include "sl/rx/exec/executor.hpp"
#include "sl/rx/thread/detail/unbound_blocking_queue.hpp"
#include "sl/rx/thread/pool/config.hpp"
#include "sl/rx/thread/sync/wait_group.hpp"

#include <sl/meta/traits/unique.hpp>

#include <thread>
#include <vector>

namespace sl::rx {

struct monolithic_thread_pool final
    : executor
    , meta::immovable {
    // starts when initialized
    explicit monolithic_thread_pool(thread_pool_config config);
    ~monolithic_thread_pool() noexcept override;

    // after stop every scheduled task is cancelled
    void schedule(task_node* task_node) noexcept override;
    void stop() noexcept override;

    void wait_idle();

private:
    void worker_job();

private:
    std::vector<std::thread> workers_;
    detail::unbound_blocking_queue<task_node> tq_;
    wait_group<> wg_;
};

} // namespace sl::rx
