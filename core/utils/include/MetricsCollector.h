#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace NetLink {

    // Snapshot structs for returning metrics (non-atomic)
    struct TransferMetricsSnapshot {
        uint64_t bytesSent{0};
        uint64_t bytesReceived{0};
        uint64_t connectionsOpened{0};
        uint64_t connectionsAccepted{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersFailed{0};
        uint64_t retryAttempts{0};
        uint64_t protocolErrors{0};
        uint64_t filesReceived{0};
        uint64_t bytesResumed{0};
    };

    struct DiscoveryMetricsSnapshot {
        uint64_t beaconsSent{0};
        uint64_t beaconSendFailures{0};
        uint64_t beaconsReceived{0};
        uint64_t beaconsDropped{0};
        uint64_t beaconsFiltered{0};
        uint64_t peersDiscovered{0};
        uint64_t peersExpired{0};
    };

    // Internal structs with atomics
    struct TransferMetrics {
        std::atomic<uint64_t> bytesSent{0};
        std::atomic<uint64_t> bytesReceived{0};
        std::atomic<uint64_t> connectionsOpened{0};
        std::atomic<uint64_t> connectionsAccepted{0};
        std::atomic<uint64_t> transfersCompleted{0};
        std::atomic<uint64_t> transfersFailed{0};
        std::atomic<uint64_t> retryAttempts{0};
        std::atomic<uint64_t> protocolErrors{0};
        std::atomic<uint64_t> filesReceived{0};
        std::atomic<uint64_t> bytesResumed{0};
    };

    struct DiscoveryMetrics {
        std::atomic<uint64_t> beaconsSent{0};
        std::atomic<uint64_t> beaconSendFailures{0};
        std::atomic<uint64_t> beaconsReceived{0};
        std::atomic<uint64_t> beaconsDropped{0};
        std::atomic<uint64_t> beaconsFiltered{0};
        std::atomic<uint64_t> peersDiscovered{0};
        std::atomic<uint64_t> peersExpired{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Transfer metrics
        void addBytesSent(uint64_t bytes);
        void addBytesReceived(uint64_t bytes);
        void addBytesResumed(uint64_t bytes);
        void incrementConnectionsOpened();
        void incrementConnectionsAccepted();
        void incrementTransfersCompleted();
        void incrementTransfersFailed();
        void incrementRetryAttempts();
        void incrementProtocolErrors();
        void incrementFilesReceived();

        // Discovery metrics
        void incrementBeaconsSent();
        void incrementBeaconSendFailures();
        void incrementBeaconsReceived();
        void incrementBeaconsDropped();
        void incrementBeaconsFiltered();
        void incrementPeersDiscovered();
        void incrementPeersExpired(uint64_t count = 1);

        TransferMetricsSnapshot getTransferMetrics() const;
        DiscoveryMetricsSnapshot getDiscoveryMetrics() const;

        // Get formatted metrics string
        std::string getMetricsSummary() const;

        // Reset all metrics
        void reset();

        // Get uptime
        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        TransferMetrics transferMetrics_;
        DiscoveryMetrics discoveryMetrics_;

        std::chrono::steady_clock::time_point startTime_;
    };

} // namespace NetLink
