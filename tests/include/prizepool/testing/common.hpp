#pragma once

#include <prizepool/schema/encoding/scale/encoder.hpp>
#include <prizepool/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace prizepool::testing {

using scale_encoder_t = prizepool::schema::encoding::encoder<
    prizepool::schema::encoding::scale_encoder_tag>;

inline constexpr prizepool::schema::timestamp_seconds_t kGenesisTime =
    1'700'000'000;
inline constexpr prizepool::schema::duration_seconds_t kOneDay = 24 * 60 * 60;
inline constexpr prizepool::schema::duration_seconds_t kOneYear =
    prizepool::schema::kSecondsPerYear;

inline prizepool::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = prizepool::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline prizepool::schema::account_id_t make_account(const uint8_t seed) {
  auto account = prizepool::schema::account_id_t{};
  account[0] = seed;
  account[31] = 0xA5;
  return account;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace prizepool::testing
