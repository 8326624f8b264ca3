#pragma once

#include <prizepool/schema/event_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(prizepool::schema,
                             event_type_t,
                             prizepool::schema::event_type_t::vault_created,
                             prizepool::schema::event_type_t::deposited,
                             prizepool::schema::event_type_t::withdrawn,
                             prizepool::schema::event_type_t::winner_selected,
                             prizepool::schema::event_type_t::vault_deleted,
                             prizepool::schema::event_type_t::admin_changed,
                             prizepool::schema::event_type_t::reserve_funded)
