#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <turnstile/config/config.hpp>
#include <turnstile/events/capacity_gate.hpp>
#include <turnstile/events/event_controller.hpp>
#include <turnstile/ledger/journal.hpp>
#include <turnstile/ledger/transfer_engine.hpp>
#include <turnstile/ledger/wallet_store.hpp>
#include <turnstile/rpc/server.hpp>
#include <atomic>
#include <chrono>
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
  auto parsed = turnstile::config::parse_arguments(argc, argv);
  if (parsed.status == turnstile::config::parse_status::help) {
    std::cout << parsed.message << std::endl;
    return 0;
  }
  if (parsed.status == turnstile::config::parse_status::invalid) {
    std::cerr << parsed.message << std::endl;
    return 1;
  }
  const auto& config = parsed.config;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "turnstile", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.log_level);

  auto encoder = turnstile::ledger::encoder_t{};
  auto storage =
      turnstile::storage::make_storage<turnstile::storage::rocksdb_storage_tag>(
          turnstile::storage::storage_options{config.db_path,
                                              config.lock_timeout_ms});
  auto wallets = turnstile::ledger::wallet_store{encoder, storage};
  auto journal = turnstile::ledger::journal{encoder, storage, wallets};
  auto transfers = turnstile::ledger::transfer_engine{encoder, storage, wallets,
                                                      journal, config.currency};
  auto gate = turnstile::events::capacity_gate{encoder};
  auto events =
      turnstile::events::event_controller{encoder, storage, transfers, gate};

  // No realtime transport ships with the daemon; broadcasts are logged.
  events.set_broadcaster([](std::string_view room,
                            const turnstile::schema::broadcast_message_t& message) {
    spdlog::debug("Broadcast {} to {} ({} attribute(s))", message.type, room,
                  message.attributes.size());
  });
  if (config.allow_gated_access) {
    spdlog::warn("Gated events admit every user: no entitlement service");
    events.set_entitlement_checker(
        [](const turnstile::schema::user_id_t&,
           const turnstile::schema::event_id_t&) { return true; });
  }

  spdlog::info("gRPC ledger service listening on {}", config.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener =
      turnstile::rpc::listener{wallets, journal, transfers, events};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", config.grpc_address);
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
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Turnstile stopped");
  spdlog::shutdown();
  return 0;
}
