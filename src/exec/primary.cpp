//
// Created by usatiynyan.
//

#include "sl/rx/exec/primary.hpp"
#include "sl/rx/thread/pool/monolithic.hpp"

namespace sl::rx {
namespace {

constexpr std::uint32_t fallback_tcount = 4;

} // namespace

executor& primary_executor() {
    static monolithic_thread_pool pool{ thread_pool_config::hw_limit().value_or(
        thread_pool_config::with_hw_limit(fallback_tcount)
    ) };
    return pool;
}

} // namespace sl::rx
