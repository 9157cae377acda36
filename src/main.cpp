#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <sentinel/host/server.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
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

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto ledger_model = std::string{};
  auto fee_amount = std::string{};
  auto fee_recipient = std::string{};
  auto strict_crypto = true;
  auto log_level = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Sentinel"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the host service")(
      "db-path",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "sentinel.db"),
      "RocksDB directory")(
      "ledger-model",
      boost::program_options::value<std::string>(&ledger_model)
          ->default_value("multi"),
      "Ledger model deployed on first start: single|multi")(
      "fee-amount",
      boost::program_options::value<std::string>(&fee_amount)->default_value(
          "10000"),
      "Vault creation fee recorded in the deployed config (decimal)")(
      "fee-recipient",
      boost::program_options::value<std::string>(&fee_recipient),
      "Fee recipient address (64 hex chars, default zero)")(
      "strict-crypto",
      boost::program_options::value<bool>(&strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace|debug|info|warn|err|critical|off")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "sentinel.log"),
      "Log file path");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
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
      "sentinel", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto options = sentinel::execution::engine_options{};
  options.require_strict_crypto = strict_crypto;

  auto model =
      sentinel::schema::try_from_string<sentinel::schema::ledger_model_t>(
          ledger_model);
  if (!model) {
    spdlog::error("Unknown ledger model '{}', expected {}", ledger_model,
                  sentinel::schema::joined_names(
                      sentinel::schema::kLedgerModelMappings));
    spdlog::shutdown();
    return 1;
  }
  options.model = *model;

  auto fee = sentinel::schema::try_from_decimal(fee_amount);
  if (!fee) {
    spdlog::error("Invalid --fee-amount '{}'", fee_amount);
    spdlog::shutdown();
    return 1;
  }
  options.fee_amount = *fee;

  if (!fee_recipient.empty()) {
    auto recipient = sentinel::schema::try_make_hash32(fee_recipient);
    if (!recipient) {
      spdlog::error("Invalid --fee-recipient '{}'", fee_recipient);
      spdlog::shutdown();
      return 1;
    }
    options.fee_recipient = *recipient;
  }

  auto encoder = sentinel::schema::encoding::encoder<
      sentinel::schema::encoding::scale_encoder_tag>{};
  auto storage = sentinel::storage::make_storage<
      sentinel::storage::rocksdb_storage_tag>(db_path);
  auto engine = sentinel::execution::engine{encoder, storage, options};

  spdlog::info("Host service listening on {}", grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = sentinel::host::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start host service on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down host service");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
