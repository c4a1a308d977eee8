#include <warden/sync/identity_locks.hpp>

#include <utility>

namespace warden::sync {

identity_locks::guard::guard(identity_locks& owner, std::string key)
    : owner_{owner},
      key_{std::move(key)},
      lock_{owner_.checkout(key_)} {}

identity_locks::guard::~guard() {
  lock_.unlock();
  owner_.checkin(key_);
}

identity_locks::guard identity_locks::lock(
    const warden::schema::identity_ref_t& identity) {
  return guard{*this, warden::schema::identity_key(identity)};
}

std::size_t identity_locks::size() const {
  auto lock = std::scoped_lock{registry_mutex_};
  return slots_.size();
}

std::mutex& identity_locks::checkout(const std::string& key) {
  auto lock = std::scoped_lock{registry_mutex_};
  auto& entry = slots_[key];
  if (!entry) {
    entry = std::make_unique<slot>();
  }
  ++entry->users;
  return entry->mutex;
}

void identity_locks::checkin(const std::string& key) {
  auto lock = std::scoped_lock{registry_mutex_};
  auto it = slots_.find(key);
  if (it == std::end(slots_)) {
    return;
  }
  if (--it->second->users == 0) {
    slots_.erase(it);
  }
}

}  // namespace warden::sync
