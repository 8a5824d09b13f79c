//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/cancel/token.hpp"
#include "sl/rx/chan/producer.hpp"
#include "sl/rx/chan/subscription.hpp"
#include "sl/rx/chan/syntax.hpp"
#include "sl/rx/model/buffer_size.hpp"
#include "sl/rx/model/context.hpp"
#include "sl/rx/model/event.hpp"
