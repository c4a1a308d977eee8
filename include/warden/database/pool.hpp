#pragma once
#include <spdlog/spdlog.h>
#include <warden/database/session.hpp>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace warden::database {

template <typename Library>
class pool;

/// Exclusive use of one pooled session. Destroying the lease returns the
/// session to the pool; `discard()` closes it instead.
template <typename Library>
class lease final {
 public:
  lease() = default;
  lease(pool<Library>* owner, std::unique_ptr<session<Library>> held)
      : owner_{owner}, session_{std::move(held)} {}

  lease(lease&& other) noexcept
      : owner_{std::exchange(other.owner_, nullptr)},
        session_{std::move(other.session_)} {}

  lease& operator=(lease&& other) noexcept {
    if (this != &other) {
      release();
      owner_ = std::exchange(other.owner_, nullptr);
      session_ = std::move(other.session_);
    }
    return *this;
  }

  lease(const lease&) = delete;
  lease& operator=(const lease&) = delete;

  ~lease() { release(); }

  session<Library>& operator*() const { return *session_; }
  session<Library>* operator->() const { return session_.get(); }
  explicit operator bool() const { return session_ != nullptr; }

  /// Close the session instead of returning it.
  void discard() {
    if (owner_ != nullptr && session_) {
      owner_->drop(std::move(session_));
    }
    owner_ = nullptr;
  }

  /// Return the session to the pool now.
  void release() {
    if (owner_ != nullptr && session_) {
      owner_->give_back(std::move(session_));
    }
    owner_ = nullptr;
  }

 private:
  pool<Library>* owner_{nullptr};
  std::unique_ptr<session<Library>> session_;
};

/// Bounded set of sessions. A session comes back to the idle set only when it
/// is healthy and running at its own identity; anything else is discarded, so
/// a privilege context that failed to restore never leaks into the next lease.
template <typename Library>
class pool final {
 public:
  using factory_t = std::function<std::unique_ptr<session<Library>>()>;

  pool(factory_t factory, std::size_t capacity)
      : factory_{std::move(factory)}, capacity_{capacity == 0 ? 1 : capacity} {}

  pool(const pool&) = delete;
  pool& operator=(const pool&) = delete;

  /// Block until a session is available. Throws session_error when a new
  /// session cannot be opened.
  lease<Library> acquire() {
    auto lock = std::unique_lock{mutex_};
    available_.wait(lock, [&] { return !idle_.empty() || open_ < capacity_; });
    if (!idle_.empty()) {
      auto held = std::move(idle_.back());
      idle_.pop_back();
      return lease<Library>{this, std::move(held)};
    }
    ++open_;
    lock.unlock();
    auto opened = std::unique_ptr<session<Library>>{};
    try {
      opened = factory_();
    } catch (const session_error&) {
      forget_one();
      throw;
    }
    if (!opened) {
      forget_one();
      throw session_error{"session factory returned no session", true};
    }
    return lease<Library>{this, std::move(opened)};
  }

  std::size_t idle() const {
    auto lock = std::scoped_lock{mutex_};
    return idle_.size();
  }

  std::size_t open() const {
    auto lock = std::scoped_lock{mutex_};
    return open_;
  }

  uint64_t discarded() const {
    auto lock = std::scoped_lock{mutex_};
    return discarded_;
  }

 private:
  friend class lease<Library>;

  void give_back(std::unique_ptr<session<Library>> held) {
    if (!reusable(*held)) {
      drop(std::move(held));
      return;
    }
    {
      auto lock = std::scoped_lock{mutex_};
      idle_.push_back(std::move(held));
    }
    available_.notify_one();
  }

  void drop(std::unique_ptr<session<Library>> held) {
    held.reset();
    {
      auto lock = std::scoped_lock{mutex_};
      --open_;
      ++discarded_;
    }
    spdlog::warn("Discarded pooled session");
    available_.notify_one();
  }

  void forget_one() {
    {
      auto lock = std::scoped_lock{mutex_};
      --open_;
    }
    available_.notify_one();
  }

  static bool reusable(session<Library>& held) {
    if (!held.healthy()) {
      return false;
    }
    try {
      return held.current_role() == held.session_role();
    } catch (const session_error& ex) {
      spdlog::warn("Could not confirm pooled session identity: {}", ex.what());
      held.mark_unsafe();
      return false;
    }
  }

  factory_t factory_;
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<session<Library>>> idle_;
  std::size_t open_{};
  uint64_t discarded_{};
};

}  // namespace warden::database
