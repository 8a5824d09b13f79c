//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/exec/executor.hpp"
#include "sl/rx/exec/functor_task.hpp"
#include "sl/rx/exec/immediate.hpp"
#include "sl/rx/exec/manual.hpp"
#include "sl/rx/exec/primary.hpp"
#include "sl/rx/exec/task.hpp"
#include "sl/rx/thread/pool/monolithic.hpp"
