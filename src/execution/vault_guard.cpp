#include <spdlog/spdlog.h>
#include <prizepool/execution/vault_guard.hpp>

namespace prizepool::execution {

vault_guard_table::guard::guard(vault_guard_table& table,
                                const prizepool::schema::vault_id_t vault_id)
    : table_{&table}, vault_id_{vault_id} {}

vault_guard_table::guard::guard(guard&& other) noexcept
    : table_{other.table_}, vault_id_{other.vault_id_} {
  other.table_ = nullptr;
}

vault_guard_table::guard::~guard() {
  if (table_ != nullptr) {
    table_->release(vault_id_);
  }
}

std::optional<vault_guard_table::guard> vault_guard_table::acquire(
    const prizepool::schema::vault_id_t vault_id) {
  auto self = std::this_thread::get_id();
  auto lock = std::unique_lock{mutex_};
  while (true) {
    auto owner = owners_.find(vault_id);
    if (owner == std::end(owners_)) {
      break;
    }
    if (owner->second == self) {
      spdlog::warn("Re-entrant call into vault {} rejected", vault_id);
      return std::nullopt;
    }
    released_.wait(lock);
  }
  owners_.emplace(vault_id, self);
  return std::optional<guard>{std::in_place, *this, vault_id};
}

bool vault_guard_table::held(const prizepool::schema::vault_id_t vault_id) const {
  auto lock = std::scoped_lock{mutex_};
  return owners_.contains(vault_id);
}

void vault_guard_table::release(const prizepool::schema::vault_id_t vault_id) {
  {
    auto lock = std::scoped_lock{mutex_};
    owners_.erase(vault_id);
  }
  released_.notify_all();
}

}  // namespace prizepool::execution
