#pragma once
#include <prizepool/schema/primitives.hpp>

namespace prizepool::schema {

template <uint16_t Version>
struct delete_vault;

template <>
struct delete_vault<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
};

using delete_vault_t = delete_vault<1>;

}  // namespace prizepool::schema
