#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <swapdot/relay/server.hpp>
#include <swapdot/service/admission_gate.hpp>
#include <swapdot/service/service.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  namespace po = boost::program_options;

  auto options = swapdot::common::service_options{};
  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto config_path = std::string{};
  auto master_key_hex = std::string{};
  auto write_mode = std::string{};
  auto sweep_interval_s = uint32_t{};

  auto description = po::options_description{"SwapDot"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI style config file merged under the command line")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:50061"),
      "IP:Port for the relay server")(
      "db-path",
      po::value<std::string>(&db_path)->default_value("swapdot.db"),
      "RocksDB directory")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("swapdot.log"),
      "Log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "master-key",
      po::value<std::string>(&master_key_hex)
          ->default_value(std::string(32, '0')),
      "Card master key as 16, 32 or 48 hex characters")(
      "diversify-keys",
      po::bool_switch(&options.diversify_keys)->default_value(false),
      "Derive per-token card keys from the master key")(
      "auth-session-ttl-ms",
      po::value<uint64_t>(&options.auth_session_ttl_ms)->default_value(60'000),
      "Authentication session lifetime")(
      "token-lease-ttl-ms",
      po::value<uint64_t>(&options.token_lease_ttl_ms)->default_value(15'000),
      "Authentication lease lifetime")(
      "pending-ttl-ms",
      po::value<uint64_t>(&options.pending_ttl_ms)->default_value(600'000),
      "Legacy pending transfer lifetime")(
      "transfer-session-ttl-ms",
      po::value<uint64_t>(&options.transfer_session_ttl_ms)
          ->default_value(300'000),
      "Default transfer session lifetime")(
      "staged-ttl-ms",
      po::value<uint64_t>(&options.staged_ttl_ms)->default_value(600'000),
      "Staged transfer lifetime")(
      "sweep-interval-s",
      po::value<uint32_t>(&sweep_interval_s)->default_value(900),
      "Janitor period in seconds")(
      "sweep-batch",
      po::value<std::size_t>(&options.sweep_batch)->default_value(100),
      "Records per sweep class per janitor pass")(
      "transaction-attempts",
      po::value<uint32_t>(&options.transaction_attempts)->default_value(5),
      "Conflict retries per operation")(
      "transfer-write-mode",
      po::value<std::string>(&write_mode)->default_value("plain"),
      "plain, maced or enciphered");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "swapdot", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto master_key = swapdot::schema::try_from_hex(master_key_hex);
  if (!master_key || (master_key->size() != 8 && master_key->size() != 16 &&
                      master_key->size() != 24)) {
    spdlog::error("master-key must be 8, 16 or 24 bytes of hex");
    spdlog::shutdown();
    return 1;
  }
  options.master_key = std::move(*master_key);

  auto mode = swapdot::schema::try_from_string<swapdot::schema::comm_mode_t>(
      write_mode);
  if (!mode) {
    spdlog::error("Unknown transfer-write-mode '{}'", write_mode);
    spdlog::shutdown();
    return 1;
  }
  options.transfer_write_mode = *mode;

  spdlog::info("Opening ledger at '{}'", db_path);
  auto service = swapdot::service::service{
      options,
      swapdot::storage::make_storage<swapdot::storage::rocksdb_storage_tag>(
          db_path)};
  auto gate = swapdot::service::allow_all_gate{};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = swapdot::relay::listener{service, gate};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start relay on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("Relay listening on {}", grpc_address);
  grpc_server->GetHealthCheckService()->SetServingStatus(true);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    auto next_sweep = std::chrono::steady_clock::now();
    while (!shutdown_requested()) {
      if (std::chrono::steady_clock::now() >= next_sweep) {
        service.run_janitor();
        next_sweep = std::chrono::steady_clock::now() +
                     std::chrono::seconds(sweep_interval_s);
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Relay stopped");
  spdlog::shutdown();
  return 0;
}
