#pragma once
#include <prizepool/schema/primitives.hpp>

namespace prizepool::schema {

template <uint16_t Version>
struct withdraw;

template <>
struct withdraw<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
};

using withdraw_t = withdraw<1>;

}  // namespace prizepool::schema
