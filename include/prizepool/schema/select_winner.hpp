#pragma once
#include <prizepool/schema/primitives.hpp>

namespace prizepool::schema {

template <uint16_t Version>
struct select_winner;

template <>
struct select_winner<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
};

using select_winner_t = select_winner<1>;

}  // namespace prizepool::schema
