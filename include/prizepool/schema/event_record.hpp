#pragma once

#include <prizepool/schema/primitives.hpp>
#include <prizepool/schema/transaction_event.hpp>

// Schema type: event record.
// Pool workflow: persisted event with its sequence id and commit time.
namespace prizepool::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  timestamp_seconds_t recorded_at{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace prizepool::schema
