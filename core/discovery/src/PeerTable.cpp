#include "PeerTable.h"

namespace NetLink {

PeerTable::Update PeerTable::upsert(const std::string& ipAddress, const std::string& machineName,
                                    int port, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(ipAddress);
    if (it == peers_.end()) {
        Peer peer;
        peer.machineName = machineName;
        peer.ipAddress = ipAddress;
        peer.port = port;
        peer.firstSeen = now;
        peer.lastSeen = now;
        peers_.emplace(ipAddress, std::move(peer));
        return Update::Inserted;
    }

    Peer& peer = it->second;
    peer.lastSeen = now;
    if (peer.machineName != machineName || peer.port != port) {
        peer.machineName = machineName;
        peer.port = port;
        return Update::Changed;
    }
    return Update::Refreshed;
}

std::vector<Peer> PeerTable::sweep(TimePoint now, std::chrono::milliseconds ttl) {
    std::vector<Peer> removed;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = peers_.begin(); it != peers_.end();) {
        if (now - it->second.lastSeen > ttl) {
            removed.push_back(std::move(it->second));
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<Peer> PeerTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Peer> result;
    result.reserve(peers_.size());
    for (const auto& [ip, peer] : peers_) {
        result.push_back(peer);
    }
    return result;
}

std::optional<Peer> PeerTable::findByName(const std::string& machineName) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [ip, peer] : peers_) {
        if (peer.machineName == machineName) {
            return peer;
        }
    }
    return std::nullopt;
}

std::optional<Peer> PeerTable::findByAddress(const std::string& ipAddress) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(ipAddress);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PeerTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

void PeerTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
}

} // namespace NetLink
