#pragma once
#include <spdlog/common.h>

#include <cstdint>
#include <string>

namespace turnstile::config {

/// Runtime settings for turnstiled.
struct daemon_config final {
  std::string db_path{"turnstile.db"};
  std::string grpc_address{"0.0.0.0:50051"};
  // Upper bound on a row-lock wait before the caller sees storage_contention.
  int64_t lock_timeout_ms{1000};
  std::string currency{"USD"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"turnstile.log"};
  // Grants subscription_only/tier_gated joins when no entitlement service is
  // wired in. Off means such joins are denied.
  bool allow_gated_access{false};
};

enum class parse_status : uint8_t { run = 0, help = 1, invalid = 2 };

struct parse_result final {
  parse_status status{parse_status::run};
  daemon_config config;
  // Help text for parse_status::help, error text for parse_status::invalid.
  std::string message;
};

/// Parse the command line and, when --config names one, an INI-style file.
/// Command-line values take precedence over the file.
parse_result parse_arguments(int argc, const char* const argv[]);

}  // namespace turnstile::config
