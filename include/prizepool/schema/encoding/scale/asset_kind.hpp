#pragma once

#include <prizepool/schema/asset_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(prizepool::schema,
                             asset_kind_t,
                             prizepool::schema::asset_kind_t::native,
                             prizepool::schema::asset_kind_t::token)
