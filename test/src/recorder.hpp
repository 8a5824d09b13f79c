//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/chan.hpp"

#include <sl/meta/monad/maybe.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace sl::rx {

// collects everything a subscription delivers, has to outlive the subscription
template <typename UpdateT, typename SuccessT = meta::unit>
struct recorder {
    using event_type = event<UpdateT, SuccessT>;

    auto handler() {
        return [this](event_type&& an_event) {
            if (an_event.is_update()) {
                updates.push_back(std::move(an_event).update());
            } else {
                ++completions;
                maybe_completion.emplace(std::move(an_event).get_completion());
            }
        };
    }

    [[nodiscard]] bool succeeded() const { return maybe_completion.has_value() && maybe_completion->is_success(); }
    [[nodiscard]] bool failed() const { return maybe_completion.has_value() && maybe_completion->is_failure(); }
    [[nodiscard]] bool cancelled() const { return maybe_completion.has_value() && maybe_completion->is_cancelled(); }

    std::vector<UpdateT> updates;
    meta::maybe<completion<SuccessT>> maybe_completion;
    std::size_t completions = 0;
};

} // namespace sl::rx
