//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/chan.hpp"

#include "sl/rx/algo/filter.hpp"
#include "sl/rx/algo/flat_map.hpp"
#include "sl/rx/algo/make_producer.hpp"
#include "sl/rx/algo/map.hpp"
#include "sl/rx/algo/map_event.hpp"
#include "sl/rx/algo/unwrap.hpp"
