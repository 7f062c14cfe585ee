#pragma once

#include "../lib/Logger.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pc {

/**
 * Chain settings, usually read from a JSON file:
 * {
 *   "difficulty": 2,       leading zero hex digits required per block
 *   "genesisTime": 0,      genesis timestamp in Unix seconds, 0 = now
 *   "checkInterval": 10000 attempts between progress/cancel checks
 *   "logLevel": "info",
 *   "logFile": ""          empty = console only
 * }
 * Every key is optional.
 */
struct ChainConfig {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG_LOAD = 1;  // File missing or unparsable
  constexpr static int32_t E_CONFIG_VALUE = 2; // Bad type or range

  uint32_t difficulty{2};
  int64_t genesisTime{0};
  uint64_t checkInterval{10000};
  logging::Level logLevel{logging::Level::INFO};
  std::string logFile;

  static Roe<ChainConfig> fromJson(const nlohmann::ordered_json &j);
  static Roe<ChainConfig> load(const std::string &path);

  nlohmann::ordered_json toJson() const;

  // Set the root logger level and attach the file handler, if any
  Roe<void> applyLogging() const;
};

} // namespace pc
