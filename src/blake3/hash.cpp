#include <prizepool/blake3/hash.hpp>

namespace prizepool::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const prizepool::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const prizepool::schema::hash32_t& digest) {
  blake3_hasher_update(&state_, digest.data(), digest.size());
  return *this;
}

prizepool::schema::hash32_t hasher::finalize() const {
  auto output = prizepool::schema::hash32_t{};
  // Finalizing does not consume the state; more input may follow.
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

prizepool::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}
      .update(prizepool::schema::make_bytes_view(str))
      .finalize();
}

prizepool::schema::hash32_t hash(const prizepool::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace prizepool::blake3
