#pragma once

#include <prizepool/schema/asset_ref.hpp>
#include <prizepool/schema/enum_string.hpp>
#include <prizepool/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transfer request.
// Pool workflow: a single asset movement between an account and the pool.
// `pull` moves funds from the account into the pool, `push` pays the account.
namespace prizepool::schema {

enum class transfer_direction_t : uint8_t { pull = 0, push = 1 };

inline constexpr auto kTransferDirectionMappings = std::array{
    std::pair<std::string_view, transfer_direction_t>{
        "pull", transfer_direction_t::pull},
    std::pair<std::string_view, transfer_direction_t>{
        "push", transfer_direction_t::push},
};

template <>
inline std::optional<transfer_direction_t> try_from_string<
    transfer_direction_t>(const std::string_view value) {
  return from_string(value, kTransferDirectionMappings);
}

inline constexpr std::string_view to_string(const transfer_direction_t value) {
  return to_string(value, kTransferDirectionMappings).value_or("unknown");
}

template <uint16_t Version>
struct transfer_request;

template <>
struct transfer_request<1> final {
  uint16_t version{1};
  transfer_direction_t direction{transfer_direction_t::push};
  asset_ref_t asset;
  account_id_t account{};
  amount_t amount{0};
  vault_id_t vault_id{};
};

using transfer_request_t = transfer_request<1>;

}  // namespace prizepool::schema
