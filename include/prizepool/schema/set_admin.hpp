#pragma once
#include <prizepool/schema/primitives.hpp>

namespace prizepool::schema {

template <uint16_t Version>
struct set_admin;

template <>
struct set_admin<1> final {
  uint16_t version{1};
  account_id_t admin{};
};

using set_admin_t = set_admin<1>;

}  // namespace prizepool::schema
