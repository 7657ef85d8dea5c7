#include "AppSettings.h"
#include <algorithm>
#include <cctype>

namespace NetLink {

namespace {

bool parseInt(const std::string& value, long long& out) {
    try {
        size_t used = 0;
        out = std::stoll(value, &used);
        return used == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

Config::Validator intRange(long long low, long long high) {
    return [low, high](const std::string&, const std::string& value) {
        long long parsed = 0;
        return parseInt(value, parsed) && parsed >= low && parsed <= high;
    };
}

bool isBool(const std::string&, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "0" || lower == "true" || lower == "false" ||
           lower == "yes" || lower == "no" || lower == "on" || lower == "off";
}

bool isNonEmpty(const std::string&, const std::string& value) {
    return !value.empty();
}

} // namespace

bool AppSettings::parseProtocol(const std::string& text, ProtocolVariant& variant) {
    if (text == "resumable") { variant = ProtocolVariant::Resumable; return true; }
    if (text == "multi") { variant = ProtocolVariant::Multi; return true; }
    if (text == "legacy") { variant = ProtocolVariant::LegacySingle; return true; }
    return false;
}

std::map<std::string, Config::Validator> AppSettings::schema() {
    return {
        {"listen_port", intRange(0, 65535)},
        {"discovery_port", intRange(0, 65535)},
        {"max_attempts", intRange(1, 100)},
        {"base_delay_ms", intRange(0, 3600 * 1000)},
        {"chunk_size", intRange(512, 64 * 1024 * 1024)},
        {"connect_timeout_ms", intRange(1, 3600 * 1000)},
        {"io_timeout_ms", intRange(1, 3600 * 1000)},
        {"beacon_interval_ms", intRange(10, 3600 * 1000)},
        {"peer_ttl_ms", intRange(10, 24 * 3600 * 1000)},
        {"partial_max_age_days", intRange(0, 3650)},
        {"broadcast_only", isBool},
        {"announce_on_lan", isBool},
        {"resume_partial", isBool},
        {"verify_checksums", isBool},
        {"output_root", isNonEmpty},
        {"log_level", [](const std::string&, const std::string& value) {
            LogLevel level;
            return Logger::parseLevel(value, level);
        }},
        {"protocol", [](const std::string&, const std::string& value) {
            ProtocolVariant variant;
            return parseProtocol(value, variant);
        }},
    };
}

nlk::Result<AppSettings> AppSettings::fromConfig(const Config& config) {
    std::string failedKey;
    if (!config.validate(schema(), &failedKey)) {
        return nlk::Err<AppSettings>(nlk::ErrorCode::InvalidConfig,
            "Invalid value for '" + failedKey + "': " + config.get(failedKey) +
            " (from " + config.originOf(failedKey) + ")");
    }

    AppSettings settings;

    settings.server.port = config.getInt("listen_port", nlk::config::DEFAULT_TCP_PORT);
    settings.server.bindAddress = config.get("bind_address", "0.0.0.0");
    settings.server.outputRoot = config.get("output_root", "received");
    settings.server.ioTimeoutMs = config.getInt("io_timeout_ms", nlk::config::IO_TIMEOUT_MS);
    settings.server.chunkSize = config.getSize("chunk_size", nlk::config::NETWORK_CHUNK_SIZE);
    settings.server.verifyChecksums = config.getBool("verify_checksums", true);

    ProtocolVariant protocol = ProtocolVariant::Resumable;
    parseProtocol(config.get("protocol", "resumable"), protocol);
    settings.client.protocol = protocol;
    settings.client.chunkSize = settings.server.chunkSize;
    settings.client.connectTimeoutMs = config.getInt("connect_timeout_ms", nlk::config::CONNECT_TIMEOUT_MS);
    settings.client.ioTimeoutMs = settings.server.ioTimeoutMs;
    settings.client.retry.maxAttempts = config.getInt("max_attempts", nlk::config::DEFAULT_MAX_ATTEMPTS);
    settings.client.retry.baseDelay = std::chrono::milliseconds(
        config.getInt("base_delay_ms", nlk::config::DEFAULT_BASE_DELAY_MS));
    settings.client.resumePartial = config.getBool("resume_partial", true);

    settings.discovery.machineName = config.get("machine_name", "");
    settings.discovery.receivePort = settings.server.port;
    settings.discovery.discoveryPort = config.getInt("discovery_port", nlk::config::DEFAULT_DISCOVERY_PORT);
    settings.discovery.multicastGroup = config.get("multicast_group", nlk::config::MULTICAST_GROUP);
    settings.discovery.beaconIntervalMs = config.getInt("beacon_interval_ms", nlk::config::BEACON_INTERVAL_MS);
    settings.discovery.peerTtlMs = config.getInt("peer_ttl_ms", nlk::config::PEER_TTL_MS);
    settings.discovery.ipFilter = config.get("discovery_ip_filter", "");
    settings.discovery.broadcastOnly = config.getBool("broadcast_only", false);
    settings.discovery.announceOnLan = config.getBool("announce_on_lan", true);
    settings.discovery.unicastTargets = config.getList("unicast_targets");

    if (settings.discovery.peerTtlMs <= settings.discovery.beaconIntervalMs) {
        return nlk::Err<AppSettings>(nlk::ErrorCode::InvalidConfig,
            "peer_ttl_ms must exceed beacon_interval_ms");
    }

    settings.logFile = config.get("log_file", "");
    Logger::parseLevel(config.get("log_level", "INFO"), settings.logLevel);
    settings.partialMaxAgeDays = config.getInt("partial_max_age_days", nlk::config::PARTIAL_MAX_AGE_DAYS);

    return nlk::Ok(std::move(settings));
}

} // namespace NetLink
