//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/slot/atomic_slot.hpp"
#include "sl/rx/slot/head.hpp"
#include "sl/rx/slot/persistent_list.hpp"
