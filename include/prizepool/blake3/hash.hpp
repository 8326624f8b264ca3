#pragma once
#include <blake3.h>
#include <prizepool/schema/primitives.hpp>
#include <string_view>

namespace prizepool::blake3 {

/// Incremental BLAKE3 over a sequence of byte spans. Used for the state root
/// chain, where the previous root and every new event record are absorbed in
/// order without first concatenating them.
class hasher final {
 public:
  hasher();

  hasher& update(const prizepool::schema::bytes_view_t& bytes);
  hasher& update(const prizepool::schema::hash32_t& digest);
  prizepool::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

prizepool::schema::hash32_t hash(const std::string_view& str);
prizepool::schema::hash32_t hash(const prizepool::schema::bytes_view_t& bytes);

}  // namespace prizepool::blake3
