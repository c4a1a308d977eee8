#pragma once
#include <pqxx/pqxx>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace warden::database::postgres {

inline constexpr std::string_view kDefaultChannel{"warden_identity"};

/// LISTENs on a channel of a dedicated connection and hands every payload to
/// `handler`. Notifications arrive only for committed transactions; the
/// connection has to be polled with `pqxx::connection::await_notification`.
class listener final : public pqxx::notification_receiver {
 public:
  using handler_t = std::function<void(std::string_view payload)>;

  listener(pqxx::connection& connection,
           std::string_view channel,
           handler_t handler);

  void operator()(const std::string& payload, int backend_pid) override;

  uint64_t received() const { return received_; }

 private:
  handler_t handler_;
  uint64_t received_{};
};

}  // namespace warden::database::postgres
