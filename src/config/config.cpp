#include <turnstile/config/config.hpp>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace turnstile::config {

namespace {

namespace po = boost::program_options;

po::options_description make_description(daemon_config& config,
                                         std::string& log_level,
                                         std::string& config_file) {
  auto description = po::options_description{"Turnstile"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "Path to an INI-style configuration file")(
      "db-path,d",
      po::value<std::string>(&config.db_path)->default_value(config.db_path),
      "RocksDB directory")(
      "grpc-address,g",
      po::value<std::string>(&config.grpc_address)
          ->default_value(config.grpc_address),
      "IP:Port for the gRPC ledger service")(
      "lock-timeout-ms",
      po::value<int64_t>(&config.lock_timeout_ms)
          ->default_value(config.lock_timeout_ms),
      "Row-lock wait limit in milliseconds")(
      "currency",
      po::value<std::string>(&config.currency)->default_value(config.currency),
      "ISO 4217 code for newly opened wallets")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warning|error|critical|off")(
      "log-file",
      po::value<std::string>(&config.log_file)->default_value(config.log_file),
      "Log file path")(
      "allow-gated-access",
      po::value<bool>(&config.allow_gated_access)
          ->default_value(config.allow_gated_access)
          ->implicit_value(true),
      "Admit subscription/tier gated joins without an entitlement service");
  return description;
}

bool is_currency_code(const std::string& currency) {
  return currency.size() == 3 &&
         std::all_of(std::begin(currency), std::end(currency), [](char c) {
           return std::isupper(static_cast<unsigned char>(c)) != 0;
         });
}

parse_result invalid(std::string message) {
  auto result = parse_result{};
  result.status = parse_status::invalid;
  result.message = std::move(message);
  return result;
}

}  // namespace

parse_result parse_arguments(const int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto log_level = std::string{};
  auto config_file = std::string{};
  auto description = make_description(result.config, log_level, config_file);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        return invalid(fmt::format("cannot open config file '{}'", path));
      }
      po::store(po::parse_config_file(input, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    return invalid(e.what());
  }

  if (vm.contains("help")) {
    auto help = std::ostringstream{};
    help << description;
    result.status = parse_status::help;
    result.message = help.str();
    return result;
  }

  if (result.config.lock_timeout_ms <= 0) {
    return invalid("lock-timeout-ms must be positive");
  }
  if (!is_currency_code(result.config.currency)) {
    return invalid(fmt::format("currency '{}' is not a three-letter code",
                               result.config.currency));
  }
  result.config.log_level = spdlog::level::from_str(log_level);
  if (result.config.log_level == spdlog::level::off && log_level != "off") {
    return invalid(fmt::format("unknown log level '{}'", log_level));
  }
  if (result.config.db_path.empty()) {
    return invalid("db-path must not be empty");
  }
  return result;
}

}  // namespace turnstile::config
