//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/exec/executor.hpp"

#include <concepts>

namespace sl::rx {

// Pipelines hold the context weakly through weak_arc.
// Precondition: get_executor() returns an executor that outlives the context and every pipeline bound to it,
// e.g. primary_executor() or one owned next to the context. After the context is gone the pipeline still runs on
// that executor to deliver the cancellation, so a context must not own its executor.
template <typename ContextT>
concept ExecutionContext = requires(ContextT& context) {
    { context.get_executor() } -> std::same_as<executor&>;
};

} // namespace sl::rx
