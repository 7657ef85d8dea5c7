#include "DiscoveryService.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <netinet/in.h>
#include <poll.h>
#include <random>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace NetLink {

const char* beaconOutcomeToString(BeaconOutcome outcome) {
    switch (outcome) {
        case BeaconOutcome::NewPeer: return "new-peer";
        case BeaconOutcome::Refreshed: return "refreshed";
        case BeaconOutcome::Changed: return "changed";
        case BeaconOutcome::Self: return "self";
        case BeaconOutcome::Filtered: return "filtered";
        case BeaconOutcome::Foreign: return "foreign";
        case BeaconOutcome::Malformed: return "malformed";
    }
    return "unknown";
}

DiscoveryService::DiscoveryService(DiscoveryConfig config, Clock clock)
    : config_(std::move(config))
    , clock_(std::move(clock))
    , filter_(config_.ipFilter)
    , instanceId_(generateInstanceId())
{
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (config_.machineName.empty()) {
        config_.machineName = localHostName();
    }

    for (const auto& target : config_.unicastTargets) {
        UnicastTarget parsed{target, config_.discoveryPort};
        auto colon = target.rfind(':');
        if (colon != std::string::npos) {
            parsed.ip = target.substr(0, colon);
            try {
                parsed.port = std::stoi(target.substr(colon + 1));
            } catch (const std::exception&) {
                logger_.log(LogLevel::WARN, "Ignoring unicast target with bad port: " + target, "DiscoveryService");
                continue;
            }
        }
        struct in_addr probe;
        if (inet_pton(AF_INET, parsed.ip.c_str(), &probe) != 1 || parsed.port < 1 || parsed.port > 65535) {
            logger_.log(LogLevel::WARN, "Ignoring invalid unicast target: " + target, "DiscoveryService");
            continue;
        }
        unicastTargets_.push_back(parsed);
    }

    Beacon beacon;
    beacon.machineName = config_.machineName;
    beacon.port = config_.receivePort;
    beacon.instanceId = instanceId_;
    beacon.version = nlk::config::BEACON_VERSION;
    beaconPayload_ = BeaconCodec::encode(beacon);
}

DiscoveryService::~DiscoveryService() {
    stop();
}

nlk::Result<void> DiscoveryService::start() {
    if (running_) {
        return nlk::Ok();
    }

    auto listening = openListenSocket();
    if (!listening) {
        logger_.log(LogLevel::ERROR, listening.error().message, "DiscoveryService");
        return listening;
    }
    // Needed by sendBeaconOnce() even without the advertiser thread
    auto sending = openSendSocket();
    if (!sending) {
        logger_.log(LogLevel::ERROR, sending.error().message, "DiscoveryService");
        listenSocket_.reset();
        return sending;
    }

    running_ = true;
    listenerThread_ = std::thread(&DiscoveryService::listenerLoop, this);
    sweeperThread_ = std::thread(&DiscoveryService::sweeperLoop, this);
    if (config_.advertise) {
        advertiserThread_ = std::thread(&DiscoveryService::advertiserLoop, this);
    }

    std::string mode = config_.announceOnLan
        ? (config_.broadcastOnly ? "broadcast" : "multicast+broadcast")
        : "unicast";
    logger_.log(LogLevel::INFO, "Discovery started on UDP " + std::to_string(listenPort_) + " as '" +
                config_.machineName + "' (" + mode + ")" +
                (filter_.enabled() ? ", filter " + filter_.prefix() : ""), "DiscoveryService");
    return nlk::Ok();
}

void DiscoveryService::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wakeCv_.notify_all();

    if (advertiserThread_.joinable()) advertiserThread_.join();
    if (listenerThread_.joinable()) listenerThread_.join();
    if (sweeperThread_.joinable()) sweeperThread_.join();

    if (multicastJoined_) {
        struct ip_mreq mreq;
        memset(&mreq, 0, sizeof(mreq));
        inet_pton(AF_INET, config_.multicastGroup.c_str(), &mreq.imr_multiaddr);
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
        setsockopt(listenSocket_.get(), IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq, sizeof(mreq));
        multicastJoined_ = false;
    }
    listenSocket_.reset();
    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        sendSocket_.reset();
    }

    logger_.log(LogLevel::INFO, "Discovery stopped", "DiscoveryService");
}

nlk::Result<void> DiscoveryService::openListenSocket() {
    nlk::SocketGuard sock(socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock) {
        return nlk::Err(nlk::ErrorCode::SocketSetupFailed,
            "Failed to create UDP socket: " + std::string(strerror(errno)));
    }

    // Several receivers on one host share the discovery port
    int reuse = 1;
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config_.discoveryPort));
    addr.sin_addr.s_addr = INADDR_ANY;

    if (bind(sock.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        return nlk::Err(nlk::ErrorCode::SocketSetupFailed,
            "Failed to bind UDP socket to port " + std::to_string(config_.discoveryPort) + ": " + strerror(errno));
    }

    struct sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(sock.get(), (struct sockaddr*)&bound, &len) == 0) {
        listenPort_ = ntohs(bound.sin_port);
    }

    if (!config_.broadcastOnly && config_.announceOnLan) {
        struct ip_mreq mreq;
        memset(&mreq, 0, sizeof(mreq));
        if (inet_pton(AF_INET, config_.multicastGroup.c_str(), &mreq.imr_multiaddr) == 1) {
            mreq.imr_interface.s_addr = htonl(INADDR_ANY);
            if (setsockopt(sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) == 0) {
                multicastJoined_ = true;
            } else {
                logger_.log(LogLevel::WARN, "Cannot join multicast group " + config_.multicastGroup + ": " +
                            strerror(errno) + ", relying on broadcast", "DiscoveryService");
            }
        } else {
            logger_.log(LogLevel::WARN, "Invalid multicast group " + config_.multicastGroup, "DiscoveryService");
        }
    }

    listenSocket_ = std::move(sock);
    return nlk::Ok();
}

nlk::Result<void> DiscoveryService::openSendSocket() {
    nlk::SocketGuard sock(socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock) {
        return nlk::Err(nlk::ErrorCode::SocketSetupFailed,
            "Failed to create UDP send socket: " + std::string(strerror(errno)));
    }

    int broadcast = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
        logger_.log(LogLevel::WARN, "Failed to enable broadcast: " + std::string(strerror(errno)), "DiscoveryService");
    }

    unsigned char ttl = static_cast<unsigned char>(config_.multicastTtl);
    if (setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        logger_.log(LogLevel::WARN, "Failed to set multicast TTL: " + std::string(strerror(errno)), "DiscoveryService");
    }
    unsigned char loop = 1;
    setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

    std::lock_guard<std::mutex> lock(sendMutex_);
    sendSocket_ = std::move(sock);
    return nlk::Ok();
}

int DiscoveryService::sendBeaconOnce() {
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!running_ || !sendSocket_) {
        return 0;
    }

    int delivered = 0;
    if (config_.announceOnLan) {
        if (!config_.broadcastOnly && sendTo(config_.multicastGroup, config_.discoveryPort, "multicast")) {
            ++delivered;
        }
        if (sendTo("255.255.255.255", config_.discoveryPort, "broadcast")) {
            ++delivered;
        }
    }
    for (const auto& target : unicastTargets_) {
        if (sendTo(target.ip, target.port, "unicast")) {
            ++delivered;
        }
    }
    return delivered;
}

bool DiscoveryService::sendTo(const std::string& ip, int port, const char* channel) {
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

    ssize_t sent = sendto(sendSocket_.get(), beaconPayload_.data(), beaconPayload_.size(), 0,
                          (struct sockaddr*)&addr, sizeof(addr));
    if (sent < 0) {
        metrics_.incrementBeaconSendFailures();
        // Unreachable networks repeat every interval; warn once, then stay quiet
        LogLevel level = sendFailureReported_.exchange(true) ? LogLevel::DEBUG : LogLevel::WARN;
        logger_.log(level, std::string(channel) + " beacon to " + ip + ":" + std::to_string(port) +
                    " failed: " + strerror(errno), "DiscoveryService");
        return false;
    }

    metrics_.incrementBeaconsSent();
    return true;
}

BeaconOutcome DiscoveryService::handleDatagram(const std::string& payload, const std::string& senderIp) {
    metrics_.incrementBeaconsReceived();

    if (!filter_.accepts(senderIp)) {
        metrics_.incrementBeaconsFiltered();
        return BeaconOutcome::Filtered;
    }

    auto beacon = BeaconCodec::decode(payload);
    if (!beacon) {
        metrics_.incrementBeaconsDropped();
        logger_.log(LogLevel::DEBUG, "Dropped datagram from " + senderIp + ": " + beacon.error().message,
                    "DiscoveryService");
        return beacon.error().code == nlk::ErrorCode::ForeignBeacon
            ? BeaconOutcome::Foreign
            : BeaconOutcome::Malformed;
    }

    if (beacon->instanceId == instanceId_) {
        return BeaconOutcome::Self;
    }

    auto update = peers_.upsert(senderIp, beacon->machineName, beacon->port, clock_());
    switch (update) {
        case PeerTable::Update::Inserted:
            metrics_.incrementPeersDiscovered();
            logger_.log(LogLevel::INFO, "Discovered peer " + beacon->machineName + " at " + senderIp + ":" +
                        std::to_string(beacon->port), "DiscoveryService");
            notifyPeersChanged();
            return BeaconOutcome::NewPeer;
        case PeerTable::Update::Changed:
            logger_.log(LogLevel::INFO, "Peer at " + senderIp + " now announces " + beacon->machineName + ":" +
                        std::to_string(beacon->port), "DiscoveryService");
            notifyPeersChanged();
            return BeaconOutcome::Changed;
        case PeerTable::Update::Refreshed:
            break;
    }
    return BeaconOutcome::Refreshed;
}

size_t DiscoveryService::sweepExpired() {
    auto removed = peers_.sweep(clock_(), std::chrono::milliseconds(config_.peerTtlMs));
    if (removed.empty()) {
        return 0;
    }
    for (const auto& peer : removed) {
        logger_.log(LogLevel::INFO, "Peer " + peer.machineName + " (" + peer.ipAddress + ") timed out",
                    "DiscoveryService");
    }
    metrics_.incrementPeersExpired(removed.size());
    notifyPeersChanged();
    return removed.size();
}

std::vector<Peer> DiscoveryService::getPeers() const {
    return peers_.snapshot();
}

std::optional<Peer> DiscoveryService::findPeer(const std::string& machineName) const {
    return peers_.findByName(machineName);
}

void DiscoveryService::setPeersChangedCallback(PeersChangedCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    peersChangedCallback_ = std::move(callback);
}

void DiscoveryService::notifyPeersChanged() {
    PeersChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = peersChangedCallback_;
    }
    if (callback) {
        callback(peers_.snapshot());
    }
}

void DiscoveryService::advertiserLoop() {
    do {
        sendBeaconOnce();
    } while (waitFor(std::chrono::milliseconds(config_.beaconIntervalMs)));
}

void DiscoveryService::listenerLoop() {
    char buffer[nlk::config::MAX_BEACON_SIZE + 1];

    while (running_) {
        struct pollfd pfd;
        pfd.fd = listenSocket_.get();
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, 250);
        if (ready <= 0) continue;

        struct sockaddr_in senderAddr;
        socklen_t senderLen = sizeof(senderAddr);
        ssize_t len = recvfrom(listenSocket_.get(), buffer, sizeof(buffer), 0,
                               (struct sockaddr*)&senderAddr, &senderLen);
        if (len <= 0) continue;

        char senderIpBuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &(senderAddr.sin_addr), senderIpBuf, INET_ADDRSTRLEN);

        handleDatagram(std::string(buffer, static_cast<size_t>(len)), senderIpBuf);
    }
}

void DiscoveryService::sweeperLoop() {
    auto interval = std::chrono::milliseconds(std::max(50, std::min(1000, config_.peerTtlMs / 2)));
    while (waitFor(interval)) {
        sweepExpired();
    }
}

bool DiscoveryService::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    wakeCv_.wait_for(lock, duration, [this] { return !running_; });
    return running_;
}

std::string DiscoveryService::generateInstanceId() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << engine();
    return ss.str();
}

std::string DiscoveryService::localHostName() {
    char name[256];
    if (gethostname(name, sizeof(name)) == 0) {
        name[sizeof(name) - 1] = '\0';
        if (name[0] != '\0') {
            return name;
        }
    }
    return "netlink-host";
}

} // namespace NetLink
