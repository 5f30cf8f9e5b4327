#include <gtest/gtest.h>
#include <turnstile/config/config.hpp>
#include <turnstile/testing/common.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace {

turnstile::config::parse_result parse(std::vector<std::string> args) {
  args.insert(std::begin(args), "turnstiled");
  auto argv = std::vector<const char*>{};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return turnstile::config::parse_arguments(static_cast<int>(argv.size()),
                                            argv.data());
}

}  // namespace

TEST(config, defaults_apply_without_arguments) {
  auto result = parse({});
  ASSERT_EQ(result.status, turnstile::config::parse_status::run);
  EXPECT_EQ(result.config.db_path, "turnstile.db");
  EXPECT_EQ(result.config.grpc_address, "0.0.0.0:50051");
  EXPECT_EQ(result.config.lock_timeout_ms, 1000);
  EXPECT_EQ(result.config.currency, "USD");
  EXPECT_EQ(result.config.log_level, spdlog::level::info);
  EXPECT_FALSE(result.config.allow_gated_access);
}

TEST(config, command_line_overrides_defaults) {
  auto result = parse({"--db-path", "/tmp/ledger", "--grpc-address",
                       "127.0.0.1:6000", "--lock-timeout-ms", "250",
                       "--currency", "EUR", "--log-level", "debug",
                       "--allow-gated-access"});
  ASSERT_EQ(result.status, turnstile::config::parse_status::run)
      << result.message;
  EXPECT_EQ(result.config.db_path, "/tmp/ledger");
  EXPECT_EQ(result.config.grpc_address, "127.0.0.1:6000");
  EXPECT_EQ(result.config.lock_timeout_ms, 250);
  EXPECT_EQ(result.config.currency, "EUR");
  EXPECT_EQ(result.config.log_level, spdlog::level::debug);
  EXPECT_TRUE(result.config.allow_gated_access);
}

TEST(config, command_line_wins_over_config_file) {
  auto path = turnstile::testing::make_db_path("turnstile_config") + ".ini";
  {
    auto out = std::ofstream{path};
    out << "db-path = /var/lib/turnstile\n"
        << "currency = GBP\n"
        << "allow-gated-access = true\n";
  }
  auto result = parse({"--config", path, "--currency", "CAD"});
  turnstile::testing::remove_path(path);

  ASSERT_EQ(result.status, turnstile::config::parse_status::run)
      << result.message;
  EXPECT_EQ(result.config.db_path, "/var/lib/turnstile");
  EXPECT_EQ(result.config.currency, "CAD");
  EXPECT_TRUE(result.config.allow_gated_access);
}

TEST(config, rejects_bad_values) {
  EXPECT_EQ(parse({"--lock-timeout-ms", "0"}).status,
            turnstile::config::parse_status::invalid);
  EXPECT_EQ(parse({"--currency", "usd"}).status,
            turnstile::config::parse_status::invalid);
  EXPECT_EQ(parse({"--log-level", "chatty"}).status,
            turnstile::config::parse_status::invalid);
  EXPECT_EQ(parse({"--db-path", ""}).status,
            turnstile::config::parse_status::invalid);
  EXPECT_EQ(parse({"--no-such-flag"}).status,
            turnstile::config::parse_status::invalid);
  EXPECT_EQ(parse({"--config", "/nonexistent/turnstile.ini"}).status,
            turnstile::config::parse_status::invalid);
}

TEST(config, help_prints_options) {
  auto result = parse({"--help"});
  EXPECT_EQ(result.status, turnstile::config::parse_status::help);
  EXPECT_NE(result.message.find("--db-path"), std::string::npos);
}
