#include <warden/schema/encoding/scale/journal_records.hpp>
#include <warden/schema/key/sync_keys.hpp>
#include <warden/sync/journal.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace warden::schema;
namespace records = warden::schema::encoding::scale;

namespace warden::sync {

journal::journal(
    warden::storage::storage<warden::storage::rocksdb_storage_tag>& storage)
    : storage_{storage} {
  auto encoder = encoder_t{};
  auto sequence_key = key::make_sequence_key();
  auto stored = storage_.get<uint64_t>(
      encoder, bytes_view_t{sequence_key.data(), sequence_key.size()});
  if (stored) {
    next_sequence_ = *stored;
  }
  auto backlog = load_pending(key::make_pending_prefix());
  spdlog::info("Sync journal ready: {} pending event(s), next sequence {}",
               backlog.size(), next_sequence_);
}

bool journal::enqueue(const identity_event_t& event,
                      const error_code code,
                      const std::string_view error) {
  auto lock = std::scoped_lock{mutex_};
  auto backlog = load_pending(key::make_pending_prefix(event.identity));
  auto duplicate = std::ranges::any_of(
      backlog, [&](const pending_entry_t& entry) { return entry.event == event; });
  if (duplicate) {
    spdlog::debug("Event {} for {} already queued", to_string(event.type),
                  identity_key(event.identity));
    return false;
  }

  auto entry = pending_entry_t{.sequence = next_sequence_,
                               .event = event,
                               .attempts = 0,
                               .last_code = code,
                               .last_error = std::string{error}};
  store(entry, true);
  spdlog::info("Queued {} for {} at sequence {} ({})", to_string(event.type),
               identity_key(event.identity), entry.sequence, to_string(code));
  return true;
}

std::vector<pending_entry_t> journal::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return load_pending(key::make_pending_prefix());
}

std::vector<pending_entry_t> journal::pending_for(
    const identity_ref_t& identity) const {
  auto lock = std::scoped_lock{mutex_};
  return load_pending(key::make_pending_prefix(identity));
}

bool journal::has_pending(const identity_ref_t& identity) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_pending_prefix(identity);
  return !storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})
              .empty();
}

void journal::complete(const pending_entry_t& entry) {
  auto lock = std::scoped_lock{mutex_};
  auto entry_key = key::make_pending_key(entry.event.identity, entry.sequence);
  storage_.erase(bytes_view_t{entry_key.data(), entry_key.size()});
}

void journal::record_failure(const pending_entry_t& entry,
                             const error_code code,
                             const std::string_view error) {
  auto lock = std::scoped_lock{mutex_};
  auto updated = entry;
  ++updated.attempts;
  updated.last_code = code;
  updated.last_error = std::string{error};
  store(updated, false);
}

std::size_t journal::revise(const identity_ref_t& identity,
                            const reviser_t& reviser) {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto batch = warden::storage::write_batch_t{};
  auto dropped = std::size_t{};
  for (const auto& entry :
       load_pending(key::make_pending_prefix(identity))) {
    auto revised = reviser(entry);
    auto entry_key = key::make_pending_key(identity, entry.sequence);
    if (!revised) {
      batch.erases.push_back(std::move(entry_key));
      ++dropped;
      continue;
    }
    if (*revised == entry.event) {
      continue;
    }
    auto updated = entry;
    updated.event = std::move(*revised);
    batch.puts.push_back(
        {std::move(entry_key), encoder.encode(records::to_record(updated))});
  }
  if (!batch.erases.empty() || !batch.puts.empty()) {
    storage_.write_batch(batch);
    spdlog::info("Revised queued events for {}: {} dropped, {} rewritten",
                 identity_key(identity), dropped, batch.puts.size());
  }
  return batch.erases.size() + batch.puts.size();
}

void journal::flag(const flagged_identity_t& flagged) {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto flagged_key = key::make_flagged_key(flagged.identity);
  storage_.put(encoder, bytes_view_t{flagged_key.data(), flagged_key.size()},
               records::to_record(flagged));
  spdlog::warn("Flagged {} '{}' for operator attention: {}",
               identity_key(flagged.identity), flagged.name, flagged.message);
}

void journal::clear_flag(const identity_ref_t& identity) {
  auto lock = std::scoped_lock{mutex_};
  auto flagged_key = key::make_flagged_key(identity);
  storage_.erase(bytes_view_t{flagged_key.data(), flagged_key.size()});
}

std::vector<flagged_identity_t> journal::flagged() const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto prefix = key::make_flagged_prefix();
  auto out = std::vector<flagged_identity_t>{};
  for (const auto& [entry_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto record = encoder.try_decode<records::flagged_record_t>(
        bytes_view_t{value.data(), value.size()});
    auto decoded = record ? records::from_record(*record) : std::nullopt;
    if (!decoded) {
      spdlog::warn("Skipping undecodable flagged record");
      continue;
    }
    out.push_back(std::move(*decoded));
  }
  return out;
}

std::vector<pending_entry_t> journal::load_pending(
    const bytes_t& prefix) const {
  auto encoder = encoder_t{};
  auto out = std::vector<pending_entry_t>{};
  for (const auto& [entry_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto record = encoder.try_decode<records::pending_record_t>(
        bytes_view_t{value.data(), value.size()});
    auto decoded = record ? records::from_record(*record) : std::nullopt;
    if (!decoded) {
      warden::common::critical("corrupt pending record in sync journal");
    }
    out.push_back(std::move(*decoded));
  }
  return out;
}

void journal::store(const pending_entry_t& entry, const bool advance_sequence) {
  auto encoder = encoder_t{};
  auto batch = warden::storage::write_batch_t{};
  batch.puts.push_back(
      {key::make_pending_key(entry.event.identity, entry.sequence),
       encoder.encode(records::to_record(entry))});
  if (advance_sequence) {
    next_sequence_ = entry.sequence + 1;
    batch.puts.push_back({key::make_sequence_key(), encoder.encode(next_sequence_)});
  }
  storage_.write_batch(batch);
}

}  // namespace warden::sync
