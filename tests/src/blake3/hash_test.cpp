#include <gtest/gtest.h>
#include <prizepool/blake3/hash.hpp>

TEST(blake3, empty_input_matches_reference_digest) {
  auto digest = prizepool::blake3::hash(std::string_view{});
  EXPECT_EQ(prizepool::schema::to_hex(prizepool::schema::bytes_view_t{
                digest.data(), digest.size()}),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3, incremental_updates_match_one_shot_hash) {
  auto head = prizepool::schema::make_bytes(std::string_view{"prize"});
  auto tail = prizepool::schema::make_bytes(std::string_view{"pool"});
  auto incremental = prizepool::blake3::hasher{}
                         .update(prizepool::schema::make_bytes_view(head))
                         .update(prizepool::schema::make_bytes_view(tail))
                         .finalize();
  EXPECT_EQ(incremental, prizepool::blake3::hash(std::string_view{"prizepool"}));
}

TEST(blake3, digest_update_absorbs_all_32_bytes) {
  auto digest = prizepool::schema::hash32_t{};
  digest[31] = 1;
  auto bytes = prizepool::schema::bytes_t{std::begin(digest), std::end(digest)};
  EXPECT_EQ(prizepool::blake3::hasher{}.update(digest).finalize(),
            prizepool::blake3::hash(prizepool::schema::make_bytes_view(bytes)));
}
