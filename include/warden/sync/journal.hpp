#pragma once

#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/identity_event.hpp>
#include <warden/schema/pending_entry.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::sync {

/// Durable record of work the synchronizer could not finish.
///
/// Pending events are kept per identity in arrival order and replayed by the
/// next reconciliation pass; they are never dropped while retryable. Flagged
/// identities hit a naming conflict and wait for an operator.
class journal final {
 public:
  explicit journal(
      warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage);

  journal(const journal&) = delete;
  journal& operator=(const journal&) = delete;

  /// Append an event behind the identity's backlog. Returns false (and writes
  /// nothing) when an identical event is already queued for the identity.
  bool enqueue(const warden::schema::identity_event_t& event,
               warden::schema::error_code code,
               std::string_view error);

  /// All pending entries, grouped by identity and ordered by arrival within
  /// each identity.
  std::vector<warden::schema::pending_entry_t> pending() const;

  std::vector<warden::schema::pending_entry_t> pending_for(
      const warden::schema::identity_ref_t& identity) const;

  bool has_pending(const warden::schema::identity_ref_t& identity) const;

  /// Remove an entry that has been applied (or can never be applied).
  void complete(const warden::schema::pending_entry_t& entry);

  /// Bump the attempt counter and store the latest failure.
  void record_failure(const warden::schema::pending_entry_t& entry,
                      warden::schema::error_code code,
                      std::string_view error);

  /// Returns the event an entry should carry from now on, or nullopt to
  /// drop the entry.
  using reviser_t = std::function<std::optional<warden::schema::identity_event_t>(
      const warden::schema::pending_entry_t&)>;

  /// Rewrite or drop the identity's queued entries in one batch. Entries keep
  /// their position and attempt count. Returns how many entries changed.
  std::size_t revise(const warden::schema::identity_ref_t& identity,
                     const reviser_t& reviser);

  void flag(const warden::schema::flagged_identity_t& flagged);
  void clear_flag(const warden::schema::identity_ref_t& identity);
  std::vector<warden::schema::flagged_identity_t> flagged() const;

 private:
  using encoder_t = warden::schema::encoding::encoder<
      warden::schema::encoding::scale_encoder_tag>;

  std::vector<warden::schema::pending_entry_t> load_pending(
      const warden::schema::bytes_t& prefix) const;
  void store(const warden::schema::pending_entry_t& entry,
             bool advance_sequence);

  mutable std::mutex mutex_;
  warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage_;
  uint64_t next_sequence_{1};
};

}  // namespace warden::sync
