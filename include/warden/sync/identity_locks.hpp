#pragma once

#include <warden/schema/identity.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace warden::sync {

/// Registry of per-identity mutexes. Work on one identity is serialized while
/// different identities proceed concurrently; entries are released when the
/// last holder leaves.
class identity_locks final {
 public:
  class guard final {
   public:
    guard(identity_locks& owner, std::string key);
    ~guard();

    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;

   private:
    identity_locks& owner_;
    std::string key_;
    std::unique_lock<std::mutex> lock_;
  };

  guard lock(const warden::schema::identity_ref_t& identity);

  /// Identities currently held or waited on.
  std::size_t size() const;

 private:
  struct slot final {
    std::mutex mutex;
    std::size_t users{};
  };

  std::mutex& checkout(const std::string& key);
  void checkin(const std::string& key);

  mutable std::mutex registry_mutex_;
  std::map<std::string, std::unique_ptr<slot>> slots_;
};

}  // namespace warden::sync
