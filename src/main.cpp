#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/database/directory.hpp>
#include <warden/database/pool.hpp>
#include <warden/database/postgres/listener.hpp>
#include <warden/database/postgres/session.hpp>
#include <warden/migration/applier.hpp>
#include <warden/migration/declaration_file.hpp>
#include <warden/naming/policy.hpp>
#include <warden/schema/encoding/event_codec.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/sync/journal.hpp>
#include <warden/sync/synchronizer.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using postgres_t = warden::database::postgres_session_tag;
using synchronizer_t = warden::sync::synchronizer<postgres_t>;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

struct settings final {
  std::string command;
  std::string database_url;
  std::string journal_path;
  std::string channel;
  std::string declarations;
  std::string log_file;
  std::string log_level;
  uint32_t retry_interval{};
  uint32_t reconcile_interval{};
  std::size_t pool_size{};
  warden::naming::policy_options naming;
  warden::database::directory_queries queries;
};

void install_logger(const settings& config) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!config.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        config.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "wardend", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(config.log_level));
}

int run_reconcile(synchronizer_t& sync,
                  warden::database::pool<postgres_t>& pool,
                  const settings& config) {
  auto directory = warden::schema::directory_snapshot_t{};
  try {
    auto leased = pool.acquire();
    directory = warden::database::load_directory(*leased, config.queries);
  } catch (const warden::database::session_error& ex) {
    spdlog::error("Could not read the identity store: {}", ex.what());
    return 1;
  }
  auto report = sync.reconcile(directory);
  for (const auto& result : report.results) {
    if (!result.ok()) {
      spdlog::warn("{} {}: {} {}", to_string(result.type),
                   warden::schema::identity_key(result.identity),
                   to_string(result.code), result.log);
    }
  }
  for (const auto& flagged : sync.flagged()) {
    spdlog::warn("Flagged {} '{}': {}",
                 warden::schema::identity_key(flagged.identity), flagged.name,
                 flagged.message);
  }
  return report.failures == 0 ? 0 : 2;
}

int run_retry(synchronizer_t& sync) {
  auto failures = 0;
  for (const auto& result : sync.retry_pending()) {
    if (!result.ok()) {
      ++failures;
    }
  }
  return failures == 0 ? 0 : 2;
}

int run_apply(warden::database::pool<postgres_t>& pool,
              const settings& config) {
  if (config.declarations.empty()) {
    spdlog::error("apply needs --declarations");
    return 1;
  }
  auto error = std::string{};
  auto declarations =
      warden::migration::load_declarations(config.declarations, error);
  if (!declarations) {
    spdlog::error("Invalid declaration file {}: {}", config.declarations,
                  error);
    return 1;
  }
  try {
    auto leased = pool.acquire();
    auto applier = warden::migration::applier<postgres_t>{*leased};
    for (const auto& result : applier.apply_all(*declarations)) {
      if (!result.ok()) {
        spdlog::error("Declarations for '{}' failed at statement {}: {}",
                      result.entity, result.failed_index.value_or(0),
                      result.log);
        return 2;
      }
    }
  } catch (const warden::database::session_error& ex) {
    spdlog::error("Could not open a session: {}", ex.what());
    return 1;
  }
  return 0;
}

int run_listen(synchronizer_t& sync,
               warden::database::pool<postgres_t>& pool,
               const settings& config) {
  using clock = std::chrono::steady_clock;

  run_reconcile(sync, pool, config);
  auto last_retry = clock::now();
  auto last_reconcile = clock::now();

  while (!shutdown_requested()) {
    try {
      auto listening =
          warden::database::make_session<postgres_t>(config.database_url);
      auto channel = warden::database::postgres::listener{
          *listening.connection, config.channel,
          [&](const std::string_view payload) {
            auto error = std::string{};
            auto event = warden::schema::encoding::decode_event(payload, error);
            if (!event) {
              spdlog::warn("Ignoring malformed event '{}': {}", payload, error);
              return;
            }
            auto result = sync.apply(*event);
            if (!result.ok()) {
              spdlog::warn("{} {}: {} {}", to_string(result.type),
                           warden::schema::identity_key(result.identity),
                           to_string(result.code), result.log);
            }
          }};

      while (!shutdown_requested()) {
        listening.connection->await_notification(1, 0);
        auto now = clock::now();
        if (now - last_retry >= std::chrono::seconds{config.retry_interval}) {
          run_retry(sync);
          last_retry = now;
        }
        if (now - last_reconcile >=
            std::chrono::seconds{config.reconcile_interval}) {
          run_reconcile(sync, pool, config);
          last_reconcile = now;
        }
      }
    } catch (const pqxx::broken_connection& ex) {
      spdlog::error("Lost the listening connection: {}", ex.what());
    } catch (const warden::database::session_error& ex) {
      spdlog::error("Could not open the listening connection: {}", ex.what());
    }
    if (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::seconds{1});
      // Events may have been missed while disconnected.
      last_reconcile = clock::time_point{};
    }
  }
  spdlog::info("Shutting down listener");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config = settings{};
  auto config_file = std::string{};
  auto reserved_prefixes = std::vector<std::string>{};
  auto unmanaged_roles = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Warden"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "INI file with any of the options below")(
      "database-url,d",
      boost::program_options::value<std::string>(&config.database_url)
          ->default_value("postgresql:///postgres"),
      "libpq connection string of the managed database")(
      "journal-path,j",
      boost::program_options::value<std::string>(&config.journal_path)
          ->default_value("warden-journal"),
      "RocksDB directory of the sync journal")(
      "user-prefix",
      boost::program_options::value<std::string>(&config.naming.user_prefix)
          ->default_value("user_"),
      "Prefix of user roles")(
      "group-prefix",
      boost::program_options::value<std::string>(&config.naming.group_prefix)
          ->default_value("role_"),
      "Prefix of group roles")(
      "reserved-prefix",
      boost::program_options::value<std::vector<std::string>>(
          &reserved_prefixes)
          ->composing(),
      "Extra role name prefix that is never generated")(
      "unmanaged-role",
      boost::program_options::value<std::vector<std::string>>(&unmanaged_roles)
          ->composing(),
      "Role name that is never generated or touched")(
      "channel",
      boost::program_options::value<std::string>(&config.channel)
          ->default_value(
              std::string{warden::database::postgres::kDefaultChannel}),
      "NOTIFY channel carrying identity events")(
      "retry-interval",
      boost::program_options::value<uint32_t>(&config.retry_interval)
          ->default_value(30),
      "Seconds between journal retries while listening")(
      "reconcile-interval",
      boost::program_options::value<uint32_t>(&config.reconcile_interval)
          ->default_value(3600),
      "Seconds between full reconciliation passes while listening")(
      "users-query",
      boost::program_options::value<std::string>(&config.queries.users),
      "Query returning id, username, display name, active")(
      "groups-query",
      boost::program_options::value<std::string>(&config.queries.groups),
      "Query returning id, name")(
      "members-query",
      boost::program_options::value<std::string>(&config.queries.members),
      "Query returning group id, user id")(
      "declarations",
      boost::program_options::value<std::string>(&config.declarations),
      "Permission declaration file for the apply command")(
      "pool-size",
      boost::program_options::value<std::size_t>(&config.pool_size)
          ->default_value(4),
      "Database sessions kept open")(
      "log-file",
      boost::program_options::value<std::string>(&config.log_file)
          ->default_value("wardend.log"),
      "Log file; empty disables file logging")(
      "log-level",
      boost::program_options::value<std::string>(&config.log_level)
          ->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "command",
      boost::program_options::value<std::string>(&config.command)
          ->default_value("listen"),
      "reconcile, listen, retry or apply");

  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(description)
            .positional(positional)
            .run(),
        vm);
    if (vm.contains("config")) {
      boost::program_options::store(
          boost::program_options::parse_config_file(
              vm["config"].as<std::string>().c_str(), description),
          vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  for (const auto& prefix : reserved_prefixes) {
    config.naming.reserved_prefixes.push_back(prefix);
  }
  for (const auto& role : unmanaged_roles) {
    config.naming.reserved_names.insert(role);
  }

  install_logger(config);

  auto policy = warden::naming::policy{config.naming};
  auto valid = policy.validate();
  if (!valid.ok()) {
    spdlog::error("Invalid naming policy: {}", valid.log);
    spdlog::shutdown();
    return 1;
  }

  auto journal_storage =
      warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
          config.journal_path);
  auto journal = warden::sync::journal{journal_storage};
  auto pool = warden::database::pool<postgres_t>{
      [url = config.database_url] {
        return std::make_unique<warden::database::session<postgres_t>>(
            warden::database::make_session<postgres_t>(url));
      },
      config.pool_size};
  auto sync = synchronizer_t{pool, policy, journal};

  spdlog::info("wardend {} against the identity store, journal at {}",
               config.command, config.journal_path);

  auto status = 0;
  if (config.command == "reconcile") {
    status = run_reconcile(sync, pool, config);
  } else if (config.command == "retry") {
    status = run_retry(sync);
  } else if (config.command == "apply") {
    status = run_apply(pool, config);
  } else if (config.command == "listen") {
    status = run_listen(sync, pool, config);
  } else {
    spdlog::error("Unknown command '{}'", config.command);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
