#pragma once

#include <prizepool/schema/transfer_request.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(prizepool::schema,
                             transfer_direction_t,
                             prizepool::schema::transfer_direction_t::pull,
                             prizepool::schema::transfer_direction_t::push)
