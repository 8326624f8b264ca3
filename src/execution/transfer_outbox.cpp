#include <spdlog/spdlog.h>
#include <algorithm>
#include <prizepool/execution/transfer_outbox.hpp>
#include <prizepool/schema/encoding/scale/encoder.hpp>
#include <prizepool/schema/key/engine_keys.hpp>
#include <string>
#include <tuple>

using namespace prizepool::schema;

namespace prizepool::execution {

transfer_outbox::transfer_outbox(
    prizepool::schema::encoding::encoder<
        prizepool::schema::encoding::scale_encoder_tag>& encoder,
    prizepool::storage::storage<prizepool::storage::rocksdb_storage_tag>&
        storage)
    : encoder_{encoder}, storage_{storage} {}

uint64_t transfer_outbox::append(const transfer_request_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto sequence_key = key::make_outbox_sequence_key(encoder_);
  auto sequence =
      storage_.get<uint64_t>(encoder_, make_bytes_view(sequence_key))
          .value_or(1);
  storage_.commit(prizepool::storage::write_batch_t{
      {.key = key::make_outbox_key(encoder_, sequence),
       .value = encoder_.encode(request)},
      {.key = sequence_key, .value = encoder_.encode(uint64_t{sequence + 1})}});
  spdlog::debug("Queued {} of {} for vault {} as outbox entry {}",
                to_string(request.direction), to_string(request.amount),
                request.vault_id, sequence);
  return sequence;
}

std::vector<outbox_entry_t> transfer_outbox::list() const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_prefix_key(encoder_, key::kOutboxPrefix);
  auto rows = storage_.list_by_prefix(make_bytes_view(prefix));
  auto out = std::vector<outbox_entry_t>{};
  out.reserve(rows.size());
  for (const auto& [raw_key, raw_value] : rows) {
    auto decoded_key = encoder_.try_decode<std::tuple<std::string, uint64_t>>(
        make_bytes_view(raw_key));
    if (!decoded_key.has_value()) {
      spdlog::warn("Skipping malformed outbox key");
      continue;
    }
    out.emplace_back(std::get<1>(decoded_key.value()),
                     encoder_.decode<transfer_request_t>(
                         make_bytes_view(raw_value)));
  }
  std::sort(std::begin(out), std::end(out),
            [](const outbox_entry_t& lhs, const outbox_entry_t& rhs) {
              return lhs.first < rhs.first;
            });
  return out;
}

asset_transfer_t transfer_outbox::hook() {
  return [this](const transfer_request_t& request) {
    append(request);
    return true;
  };
}

}  // namespace prizepool::execution
