#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace NetLink {

struct Peer {
    std::string machineName;
    std::string ipAddress;
    int port{0};
    std::chrono::steady_clock::time_point firstSeen;
    std::chrono::steady_clock::time_point lastSeen;
};

/**
 * @brief Optional source-address prefix; an empty prefix accepts everything
 */
class DiscoveryFilter {
public:
    explicit DiscoveryFilter(std::string prefix = "") : prefix_(std::move(prefix)) {}

    bool enabled() const { return !prefix_.empty(); }
    bool accepts(const std::string& ipAddress) const {
        return prefix_.empty() || ipAddress.compare(0, prefix_.size(), prefix_) == 0;
    }
    const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

/**
 * @brief Currently reachable peers keyed by source IP
 *
 * Written by the listener and the TTL sweep, read by UI code. All access
 * goes through one mutex; callers pass the current time so tests can
 * drive expiry without sleeping.
 */
class PeerTable {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    enum class Update {
        Inserted,
        Refreshed,
        Changed     // name or port differ from the previous beacon
    };

    Update upsert(const std::string& ipAddress, const std::string& machineName, int port, TimePoint now);

    /**
     * @brief Remove peers not seen for longer than ttl
     * @return the removed peers
     */
    std::vector<Peer> sweep(TimePoint now, std::chrono::milliseconds ttl);

    std::vector<Peer> snapshot() const;
    std::optional<Peer> findByName(const std::string& machineName) const;
    std::optional<Peer> findByAddress(const std::string& ipAddress) const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, Peer> peers_;
};

} // namespace NetLink
