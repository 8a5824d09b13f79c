//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/config.hpp"

#include <sl/meta/monad/maybe.hpp>

#include <libassert/assert.hpp>

#include <cstddef>

namespace sl::rx {

// how many pending updates a subscription keeps, the oldest ones are dropped on overflow
struct buffer_size {
    static constexpr buffer_size default_size() { return buffer_size{ default_buffer_size }; }
    static constexpr buffer_size unlimited() { return buffer_size{ 0 }; }
    static buffer_size specific(std::size_t limit) {
        ASSERT(limit > 0, "use buffer_size::unlimited() instead");
        return buffer_size{ limit };
    }

    [[nodiscard]] constexpr bool is_unlimited() const { return limit_ == 0; }
    [[nodiscard]] meta::maybe<std::size_t> limit() const {
        if (is_unlimited()) {
            return tl::nullopt;
        }
        return limit_;
    }

    // how many of the oldest updates have to be dropped to fit
    [[nodiscard]] constexpr std::size_t overflow(std::size_t pending) const {
        return is_unlimited() || pending <= limit_ ? 0 : pending - limit_;
    }

    constexpr bool operator==(const buffer_size&) const = default;

private:
    constexpr explicit buffer_size(std::size_t limit) : limit_{ limit } {}

private:
    std::size_t limit_;
};

} // namespace sl::rx
