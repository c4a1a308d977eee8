#include <warden/schema/key/builder.hpp>
#include <warden/schema/key/sync_keys.hpp>

namespace warden::schema::key {

warden::schema::bytes_t make_pending_prefix() {
  return builder{}.write(kPendingKeyPrefix).data;
}

warden::schema::bytes_t make_pending_prefix(const identity_ref_t& identity) {
  return builder{}.write(kPendingKeyPrefix).write(identity).data;
}

warden::schema::bytes_t make_pending_key(const identity_ref_t& identity,
                                         const uint64_t sequence) {
  return builder{}.write(kPendingKeyPrefix).write(identity).write(sequence).data;
}

warden::schema::bytes_t make_flagged_prefix() {
  return builder{}.write(kFlaggedKeyPrefix).data;
}

warden::schema::bytes_t make_flagged_key(const identity_ref_t& identity) {
  return builder{}.write(kFlaggedKeyPrefix).write(identity).data;
}

warden::schema::bytes_t make_sequence_key() {
  return builder{}.write(kSequenceKey).data;
}

}  // namespace warden::schema::key
