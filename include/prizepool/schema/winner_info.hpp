#pragma once
#include <prizepool/schema/primitives.hpp>

namespace prizepool::schema {

template <uint16_t Version>
struct winner_info;

template <>
struct winner_info<1> final {
  uint16_t version{1};
  account_id_t winner{};
  amount_t total_interest{0};
};

using winner_info_t = winner_info<1>;

}  // namespace prizepool::schema
