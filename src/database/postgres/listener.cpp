#include <warden/database/postgres/listener.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace warden::database::postgres {

listener::listener(pqxx::connection& connection,
                   const std::string_view channel,
                   handler_t handler)
    : pqxx::notification_receiver{connection, channel},
      handler_{std::move(handler)} {
  spdlog::info("Listening for identity events on channel '{}'", channel);
}

void listener::operator()(const std::string& payload, const int backend_pid) {
  ++received_;
  spdlog::debug("Notification from backend {}: {}", backend_pid, payload);
  if (handler_) {
    handler_(payload);
  }
}

}  // namespace warden::database::postgres
