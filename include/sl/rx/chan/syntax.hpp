//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/chan/producer.hpp"

#include <concepts>
#include <utility>

namespace sl::rx {

template <SomeChannel ChannelT, typename ContinuationTV>
    requires std::invocable<ContinuationTV, const ChannelT&>
constexpr auto operator|(const ChannelT& source, ContinuationTV&& continuation) {
    return std::forward<ContinuationTV>(continuation)(source);
}

} // namespace sl::rx
