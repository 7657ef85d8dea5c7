#include "MetricsCollector.h"
#include <sstream>
#include <iomanip>

namespace NetLink {

    MetricsCollector::MetricsCollector() 
        : startTime_(std::chrono::steady_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    // Transfer metrics
    void MetricsCollector::addBytesSent(uint64_t bytes) { transferMetrics_.bytesSent += bytes; }
    void MetricsCollector::addBytesReceived(uint64_t bytes) { transferMetrics_.bytesReceived += bytes; }
    void MetricsCollector::addBytesResumed(uint64_t bytes) { transferMetrics_.bytesResumed += bytes; }
    void MetricsCollector::incrementConnectionsOpened() { transferMetrics_.connectionsOpened++; }
    void MetricsCollector::incrementConnectionsAccepted() { transferMetrics_.connectionsAccepted++; }
    void MetricsCollector::incrementTransfersCompleted() { transferMetrics_.transfersCompleted++; }
    void MetricsCollector::incrementTransfersFailed() { transferMetrics_.transfersFailed++; }
    void MetricsCollector::incrementRetryAttempts() { transferMetrics_.retryAttempts++; }
    void MetricsCollector::incrementProtocolErrors() { transferMetrics_.protocolErrors++; }
    void MetricsCollector::incrementFilesReceived() { transferMetrics_.filesReceived++; }

    // Discovery metrics
    void MetricsCollector::incrementBeaconsSent() { discoveryMetrics_.beaconsSent++; }
    void MetricsCollector::incrementBeaconSendFailures() { discoveryMetrics_.beaconSendFailures++; }
    void MetricsCollector::incrementBeaconsReceived() { discoveryMetrics_.beaconsReceived++; }
    void MetricsCollector::incrementBeaconsDropped() { discoveryMetrics_.beaconsDropped++; }
    void MetricsCollector::incrementBeaconsFiltered() { discoveryMetrics_.beaconsFiltered++; }
    void MetricsCollector::incrementPeersDiscovered() { discoveryMetrics_.peersDiscovered++; }
    void MetricsCollector::incrementPeersExpired(uint64_t count) { discoveryMetrics_.peersExpired += count; }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot snapshot;
        snapshot.bytesSent = transferMetrics_.bytesSent.load();
        snapshot.bytesReceived = transferMetrics_.bytesReceived.load();
        snapshot.connectionsOpened = transferMetrics_.connectionsOpened.load();
        snapshot.connectionsAccepted = transferMetrics_.connectionsAccepted.load();
        snapshot.transfersCompleted = transferMetrics_.transfersCompleted.load();
        snapshot.transfersFailed = transferMetrics_.transfersFailed.load();
        snapshot.retryAttempts = transferMetrics_.retryAttempts.load();
        snapshot.protocolErrors = transferMetrics_.protocolErrors.load();
        snapshot.filesReceived = transferMetrics_.filesReceived.load();
        snapshot.bytesResumed = transferMetrics_.bytesResumed.load();
        return snapshot;
    }

    DiscoveryMetricsSnapshot MetricsCollector::getDiscoveryMetrics() const {
        DiscoveryMetricsSnapshot snapshot;
        snapshot.beaconsSent = discoveryMetrics_.beaconsSent.load();
        snapshot.beaconSendFailures = discoveryMetrics_.beaconSendFailures.load();
        snapshot.beaconsReceived = discoveryMetrics_.beaconsReceived.load();
        snapshot.beaconsDropped = discoveryMetrics_.beaconsDropped.load();
        snapshot.beaconsFiltered = discoveryMetrics_.beaconsFiltered.load();
        snapshot.peersDiscovered = discoveryMetrics_.peersDiscovered.load();
        snapshot.peersExpired = discoveryMetrics_.peersExpired.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        auto transfer = getTransferMetrics();
        auto discovery = getDiscoveryMetrics();
        auto uptime = getUptime();

        std::ostringstream ss;
        ss << "=== NetLink Metrics ===" << std::endl;
        ss << "Uptime: " << uptime.count() << "s" << std::endl;
        ss << std::endl;

        ss << "--- Transfer ---" << std::endl;
        ss << "Bytes Sent: " << transfer.bytesSent << std::endl;
        ss << "Bytes Received: " << transfer.bytesReceived << std::endl;
        ss << "Bytes Skipped By Resume: " << transfer.bytesResumed << std::endl;
        ss << "Connections Opened: " << transfer.connectionsOpened << std::endl;
        ss << "Connections Accepted: " << transfer.connectionsAccepted << std::endl;
        ss << "Transfers Completed: " << transfer.transfersCompleted << std::endl;
        ss << "Transfers Failed: " << transfer.transfersFailed << std::endl;
        ss << "Retry Attempts: " << transfer.retryAttempts << std::endl;
        ss << "Protocol Errors: " << transfer.protocolErrors << std::endl;
        ss << "Files Received: " << transfer.filesReceived << std::endl;
        ss << std::endl;

        ss << "--- Discovery ---" << std::endl;
        ss << "Beacons Sent: " << discovery.beaconsSent << std::endl;
        ss << "Beacon Send Failures: " << discovery.beaconSendFailures << std::endl;
        ss << "Beacons Received: " << discovery.beaconsReceived << std::endl;
        ss << "Beacons Dropped: " << discovery.beaconsDropped << std::endl;
        ss << "Beacons Filtered: " << discovery.beaconsFiltered << std::endl;
        ss << "Peers Discovered: " << discovery.peersDiscovered << std::endl;
        ss << "Peers Expired: " << discovery.peersExpired << std::endl;

        return ss.str();
    }

    void MetricsCollector::reset() {
        transferMetrics_.bytesSent = 0;
        transferMetrics_.bytesReceived = 0;
        transferMetrics_.connectionsOpened = 0;
        transferMetrics_.connectionsAccepted = 0;
        transferMetrics_.transfersCompleted = 0;
        transferMetrics_.transfersFailed = 0;
        transferMetrics_.retryAttempts = 0;
        transferMetrics_.protocolErrors = 0;
        transferMetrics_.filesReceived = 0;
        transferMetrics_.bytesResumed = 0;

        discoveryMetrics_.beaconsSent = 0;
        discoveryMetrics_.beaconSendFailures = 0;
        discoveryMetrics_.beaconsReceived = 0;
        discoveryMetrics_.beaconsDropped = 0;
        discoveryMetrics_.beaconsFiltered = 0;
        discoveryMetrics_.peersDiscovered = 0;
        discoveryMetrics_.peersExpired = 0;

        startTime_ = std::chrono::steady_clock::now();
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_);
    }

} // namespace NetLink
