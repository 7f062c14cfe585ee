#include "ChainConfig.h"
#include "ProofOfWork.h"
#include "../lib/Utilities.h"

#include <stdexcept>

namespace pc {

ChainConfig::Roe<ChainConfig>
ChainConfig::fromJson(const nlohmann::ordered_json &j) {
  if (!j.is_object()) {
    return Error(E_CONFIG_VALUE, "Configuration must be a JSON object");
  }

  ChainConfig config;

  if (j.contains("difficulty")) {
    const auto &value = j["difficulty"];
    if (!value.is_number_unsigned() || value.get<uint64_t>() > MAX_DIFFICULTY) {
      return Error(E_CONFIG_VALUE, "difficulty must be an integer in [0, " +
                                       std::to_string(MAX_DIFFICULTY) + "]");
    }
    config.difficulty = value.get<uint32_t>();
  }

  if (j.contains("genesisTime")) {
    const auto &value = j["genesisTime"];
    if (!value.is_number_integer()) {
      return Error(E_CONFIG_VALUE, "genesisTime must be an integer");
    }
    config.genesisTime = value.get<int64_t>();
  }

  if (j.contains("checkInterval")) {
    const auto &value = j["checkInterval"];
    if (!value.is_number_unsigned() || value.get<uint64_t>() == 0) {
      return Error(E_CONFIG_VALUE, "checkInterval must be a positive integer");
    }
    config.checkInterval = value.get<uint64_t>();
  }

  if (j.contains("logLevel")) {
    const auto &value = j["logLevel"];
    if (!value.is_string()) {
      return Error(E_CONFIG_VALUE, "logLevel must be a string");
    }
    auto level = logging::levelFromString(value.get<std::string>());
    if (!level) {
      return Error(E_CONFIG_VALUE,
                   "Unknown logLevel: " + value.get<std::string>());
    }
    config.logLevel = *level;
  }

  if (j.contains("logFile")) {
    const auto &value = j["logFile"];
    if (!value.is_string()) {
      return Error(E_CONFIG_VALUE, "logFile must be a string");
    }
    config.logFile = value.get<std::string>();
  }

  return config;
}

ChainConfig::Roe<ChainConfig> ChainConfig::load(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_CONFIG_LOAD, jsonResult.error().message);
  }
  return fromJson(jsonResult.value());
}

nlohmann::ordered_json ChainConfig::toJson() const {
  nlohmann::ordered_json j;
  j["difficulty"] = difficulty;
  j["genesisTime"] = genesisTime;
  j["checkInterval"] = checkInterval;
  j["logLevel"] = logging::levelToString(logLevel);
  j["logFile"] = logFile;
  return j;
}

ChainConfig::Roe<void> ChainConfig::applyLogging() const {
  auto root = logging::getRootLogger();
  root.setLevel(logLevel);
  if (!logFile.empty()) {
    try {
      root.addFileHandler(logFile, logLevel);
    } catch (const std::runtime_error &e) {
      return Error(E_CONFIG_VALUE, e.what());
    }
  }
  return {};
}

} // namespace pc
