#pragma once
#include <prizepool/schema/primitives.hpp>
#include <optional>
#include <span>

namespace prizepool::schema::encoding {

// Encoder selection is a build time setting: callers name the library tag,
// e.g. encoder<scale_encoder_tag>, and the specialization does the work.
// Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  prizepool::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, prizepool::schema::bytes_t& out);

  template <typename T>
  T decode(const prizepool::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const prizepool::schema::bytes_view_t& bytes);
};

}  // namespace prizepool::schema::encoding
