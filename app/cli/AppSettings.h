#pragma once

#include "Config.h"
#include "DiscoveryService.h"
#include "Logger.h"
#include "Result.h"
#include "TransferClient.h"
#include "TransferServer.h"
#include <string>
#include <map>

namespace NetLink {

/**
 * @brief Immutable view of the configuration handed to every component
 *
 * Built once from the layered Config after validation; components receive
 * the part they need by value.
 */
struct AppSettings {
    ServerConfig server;
    ClientOptions client;
    DiscoveryConfig discovery;
    std::string logFile;
    LogLevel logLevel{LogLevel::INFO};
    int partialMaxAgeDays{nlk::config::PARTIAL_MAX_AGE_DAYS};

    static nlk::Result<AppSettings> fromConfig(const Config& config);

    /// Validators for every key fromConfig reads
    static std::map<std::string, Config::Validator> schema();

    static bool parseProtocol(const std::string& text, ProtocolVariant& variant);
};

} // namespace NetLink
