#pragma once

/**
 * @file DiscoveryService.h
 * @brief LAN peer discovery through UDP beacons
 *
 * Three threads:
 * - advertiser: announces this host every beacon interval via multicast,
 *   subnet broadcast and optional unicast targets
 * - listener: turns beacons from other hosts into peer table entries
 * - sweeper: drops peers silent for longer than the peer TTL
 */

#include "Beacon.h"
#include "Constants.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "PeerTable.h"
#include "Result.h"
#include "SocketGuard.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace NetLink {

struct DiscoveryConfig {
    std::string machineName;                 // empty: use the host name
    int receivePort{nlk::config::DEFAULT_TCP_PORT};
    int discoveryPort{nlk::config::DEFAULT_DISCOVERY_PORT};
    std::string multicastGroup{nlk::config::MULTICAST_GROUP};
    int multicastTtl{nlk::config::MULTICAST_TTL};
    int beaconIntervalMs{nlk::config::BEACON_INTERVAL_MS};
    int peerTtlMs{nlk::config::PEER_TTL_MS};
    std::string ipFilter;
    bool broadcastOnly{false};
    /// Multicast and broadcast announcements; unicast targets are always used
    bool announceOnLan{true};
    bool advertise{true};
    /// "ip" or "ip:port" for networks that drop both multicast and broadcast
    std::vector<std::string> unicastTargets;
};

enum class BeaconOutcome {
    NewPeer,
    Refreshed,
    Changed,
    Self,
    Filtered,
    Foreign,
    Malformed
};

const char* beaconOutcomeToString(BeaconOutcome outcome);

class DiscoveryService {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using PeersChangedCallback = std::function<void(const std::vector<Peer>&)>;

    explicit DiscoveryService(DiscoveryConfig config, Clock clock = nullptr);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    nlk::Result<void> start();
    void stop();
    bool isRunning() const { return running_; }

    /**
     * @brief Announce immediately on every configured channel
     * @return number of channels the beacon went out on, 0 while stopped
     */
    int sendBeaconOnce();

    /**
     * @brief Feed one received datagram through filter, parser and peer table
     *
     * Never fails: bad packets are counted and dropped.
     */
    BeaconOutcome handleDatagram(const std::string& payload, const std::string& senderIp);

    /// Remove expired peers now; returns how many went away
    size_t sweepExpired();

    std::vector<Peer> getPeers() const;
    std::optional<Peer> findPeer(const std::string& machineName) const;

    void setPeersChangedCallback(PeersChangedCallback callback);

    const DiscoveryConfig& config() const { return config_; }
    const std::string& instanceId() const { return instanceId_; }
    const std::string& machineName() const { return config_.machineName; }

    /// Port the listener is bound to, useful when configured with port 0
    int listenPort() const { return listenPort_; }

private:
    struct UnicastTarget {
        std::string ip;
        int port;
    };

    DiscoveryConfig config_;
    Clock clock_;
    DiscoveryFilter filter_;
    PeerTable peers_;
    std::string instanceId_;
    std::string beaconPayload_;
    std::vector<UnicastTarget> unicastTargets_;

    std::atomic<bool> running_{false};
    nlk::SocketGuard listenSocket_;
    nlk::SocketGuard sendSocket_;
    std::mutex sendMutex_; // guards sendSocket_
    int listenPort_{-1};
    bool multicastJoined_{false};

    std::thread advertiserThread_;
    std::thread listenerThread_;
    std::thread sweeperThread_;

    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;

    std::mutex callbackMutex_;
    PeersChangedCallback peersChangedCallback_;

    std::atomic<bool> sendFailureReported_{false};

    Logger& logger_ = Logger::instance();
    MetricsCollector& metrics_ = MetricsCollector::instance();

    nlk::Result<void> openListenSocket();
    nlk::Result<void> openSendSocket();

    void advertiserLoop();
    void listenerLoop();
    void sweeperLoop();

    /// Sleep for the given time unless stop() wakes us; false once stopping
    bool waitFor(std::chrono::milliseconds duration);

    bool sendTo(const std::string& ip, int port, const char* channel);
    void notifyPeersChanged();

    static std::string generateInstanceId();
    static std::string localHostName();
};

} // namespace NetLink
