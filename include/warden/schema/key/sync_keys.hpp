#pragma once

#include <warden/schema/identity.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

// Schema key type: sync keys.
// Key layout of the sync journal. Pending keys sort by identity, then by
// arrival sequence, so a prefix scan replays one identity's backlog in order.
namespace warden::schema::key {

inline constexpr std::string_view kPendingKeyPrefix{"SYS|SYNC|PENDING|"};
inline constexpr std::string_view kFlaggedKeyPrefix{"SYS|SYNC|FLAGGED|"};
inline constexpr std::string_view kSequenceKey{"SYS|SYNC|SEQUENCE"};

warden::schema::bytes_t make_pending_prefix();
warden::schema::bytes_t make_pending_prefix(const identity_ref_t& identity);
warden::schema::bytes_t make_pending_key(const identity_ref_t& identity,
                                         uint64_t sequence);
warden::schema::bytes_t make_flagged_prefix();
warden::schema::bytes_t make_flagged_key(const identity_ref_t& identity);
warden::schema::bytes_t make_sequence_key();

}  // namespace warden::schema::key
