//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/exec/executor.hpp"

namespace sl::rx {

// process-wide thread pool, started on first use and stopped at exit
executor& primary_executor();

} // namespace sl::rx
