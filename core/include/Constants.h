#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for NetLink
 * 
 * All magic numbers and default configuration values are defined here
 * so the wire protocol and the defaults stay consistent across the codebase.
 */

#include <cstddef>
#include <cstdint>

namespace nlk::config {

// =============================================================================
// Wire Protocol
// =============================================================================

/// Legacy single-file request: path, size, data
constexpr uint32_t MAGIC_LEGACY_SINGLE = 0xFFFF0001;

/// Multi-file request: count, manifest, data
constexpr uint32_t MAGIC_MULTI = 0xFFFF0002;

/// Resumable request: count, manifest with offsets and digests, offset reply, data
constexpr uint32_t MAGIC_RESUMABLE = 0xFFFF0003;

/// Longest relative path accepted in a manifest (bytes)
constexpr uint32_t MAX_PATH_LENGTH = 4096;

/// Largest manifest accepted by the receiver
constexpr uint32_t MAX_FILE_COUNT = 100000;

/// SHA-256 digest carried by the resumable variant (bytes)
constexpr std::size_t DIGEST_SIZE = 32;

/// Final acknowledgement written by the receiver
constexpr const char* STATUS_OK = "OK";
constexpr const char* STATUS_ERROR = "ER";
constexpr std::size_t STATUS_SIZE = 2;

/// Suffix of files still being received with the resumable variant
constexpr const char* PARTIAL_SUFFIX = ".partial";

// =============================================================================
// Transfer Configuration
// =============================================================================

/// Chunk size for network transfer (bytes)
constexpr std::size_t NETWORK_CHUNK_SIZE = 64 * 1024;  // 64KB

/// Default TCP port of the receiver
constexpr int DEFAULT_TCP_PORT = 5000;

/// TCP server backlog size
constexpr int TCP_BACKLOG = 16;

/// Connect timeout (milliseconds)
constexpr int CONNECT_TIMEOUT_MS = 5000;

/// Socket read/write timeout (milliseconds)
constexpr int IO_TIMEOUT_MS = 30000;

/// Accept loop tick (seconds)
constexpr int ACCEPT_TICK_SEC = 1;

/// Retry defaults
constexpr int DEFAULT_MAX_ATTEMPTS = 3;
constexpr int DEFAULT_BASE_DELAY_MS = 2000;

/// Age after which leftover partial files are removed (days)
constexpr int PARTIAL_MAX_AGE_DAYS = 30;

// =============================================================================
// Discovery Configuration
// =============================================================================

/// Default UDP port for peer discovery
constexpr int DEFAULT_DISCOVERY_PORT = 5007;

/// Multicast group used for beacons
constexpr const char* MULTICAST_GROUP = "239.255.77.77";

/// Multicast TTL (hops)
constexpr int MULTICAST_TTL = 2;

/// Beacon interval (milliseconds)
constexpr int BEACON_INTERVAL_MS = 1000;

/// Peer considered gone after this long without a beacon (milliseconds)
constexpr int PEER_TTL_MS = 4000;

/// Largest beacon datagram read
constexpr std::size_t MAX_BEACON_SIZE = 1024;

/// Service tag carried in every beacon
constexpr const char* BEACON_SERVICE = "netlink";
constexpr int BEACON_VERSION = 1;

// =============================================================================
// Logging
// =============================================================================

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

} // namespace nlk::config
