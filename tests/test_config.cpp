#include "ewsb/config.hpp"
#include "ewsb/log.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace ewsb;

// ============================================================================
// SlabConfig / BridgeConfig
// ============================================================================

TEST_CASE("is_power_of_two", "[config]") {
  REQUIRE(!is_power_of_two(0));
  REQUIRE(is_power_of_two(1));
  REQUIRE(is_power_of_two(4096));
  REQUIRE(!is_power_of_two(4097));
  REQUIRE(!is_power_of_two(10000));
}

TEST_CASE("SlabConfig - defaults are valid", "[config]") {
  SlabConfig config;
  REQUIRE(config.validate().has_value());
  REQUIRE(config.slot_count() == 16);
}

TEST_CASE("SlabConfig - invalid geometry", "[config]") {
  SlabConfig config;
  config.slot_capacity = 3000;
  REQUIRE(config.validate().get_error() == ErrorCode::kInvalidConfig);

  config.slot_capacity = 128 * 1024;
  REQUIRE(config.validate().get_error() == ErrorCode::kInvalidConfig);
}

TEST_CASE("BridgeConfig - zero streams rejected", "[config]") {
  BridgeConfig config;
  REQUIRE(config.validate().has_value());
  config.max_streams = 0;
  REQUIRE(config.validate().get_error() == ErrorCode::kInvalidConfig);
}

TEST_CASE("BridgeConfig - slab errors propagate", "[config]") {
  BridgeConfig config;
  config.slab.total_capacity = 1000;
  REQUIRE(!config.validate().has_value());
}

// ============================================================================
// Logger
// ============================================================================

TEST_CASE("Logger - level threshold", "[config]") {
  const Logger::Level saved = Logger::level();

  Logger::set_level(Logger::Level::kWarn);
  REQUIRE(!Logger::enabled(Logger::Level::kDebug));
  REQUIRE(!Logger::enabled(Logger::Level::kInfo));
  REQUIRE(Logger::enabled(Logger::Level::kWarn));
  REQUIRE(Logger::enabled(Logger::Level::kError));

  Logger::set_level(Logger::Level::kOff);
  REQUIRE(!Logger::enabled(Logger::Level::kError));

  Logger::set_level(saved);
}
