#pragma once

#include <prizepool/schema/primitives.hpp>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace prizepool::execution {

/// Per-vault mutual exclusion for mutating operations.
///
/// Each entry records the thread that holds the vault. Another thread asking
/// for a held vault waits; the holding thread asking again (a transfer hook
/// calling back into the engine) is refused.
class vault_guard_table final {
 public:
  class guard final {
   public:
    guard(vault_guard_table& table, prizepool::schema::vault_id_t vault_id);
    guard(guard&& other) noexcept;
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    guard& operator=(guard&&) = delete;
    ~guard();

    prizepool::schema::vault_id_t vault_id() const { return vault_id_; }

   private:
    vault_guard_table* table_;
    prizepool::schema::vault_id_t vault_id_;
  };

  /// Block until the vault is free, then hold it. Returns std::nullopt when
  /// the calling thread already holds the vault.
  std::optional<guard> acquire(prizepool::schema::vault_id_t vault_id);

  bool held(prizepool::schema::vault_id_t vault_id) const;

 private:
  void release(prizepool::schema::vault_id_t vault_id);

  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::unordered_map<prizepool::schema::vault_id_t, std::thread::id> owners_;
};

}  // namespace prizepool::execution
