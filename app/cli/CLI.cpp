#include "CLI.h"
#include "MetricsCollector.h"
#include "Version.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace NetLink {

namespace {
    volatile sig_atomic_t signalReceived = 0;

    void signalHandler(int) {
        signalReceived = 1;
    }

    void installSignalHandlers() {
        signalReceived = 0;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
    }

    /// Sleep in short steps until a signal arrives or the deadline passes (0 = no deadline)
    void waitForSignal(int durationSec) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(durationSec);
        while (!signalReceived) {
            if (durationSec > 0 && std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    bool parsePort(const std::string& text, int& port) {
        try {
            size_t used = 0;
            int value = std::stoi(text, &used);
            if (used != text.size() || value < 0 || value > 65535) return false;
            port = value;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    void printPeers(const std::vector<Peer>& peers) {
        std::cout << "Peers (" << peers.size() << "):" << std::endl;
        for (const auto& peer : peers) {
            std::cout << "  " << std::left << std::setw(24) << peer.machineName
                      << peer.ipAddress << ":" << peer.port << std::endl;
        }
    }
}

nlk::Result<CLI::Options> CLI::parseArguments(int argc, char* argv[]) {
    Options options;
    if (argc < 2) {
        return nlk::Ok(options);
    }

    std::string command = argv[1];
    if (command == "receive") {
        options.command = Command::Receive;
    } else if (command == "send") {
        options.command = Command::Send;
    } else if (command == "discover") {
        options.command = Command::Discover;
    } else if (command == "--help" || command == "-h" || command == "help") {
        options.command = Command::Help;
        return nlk::Ok(options);
    } else if (command == "--version") {
        options.command = Command::Version;
        return nlk::Ok(options);
    } else {
        return nlk::Err<Options>(nlk::ErrorCode::InvalidArgument, "Unknown command: " + command);
    }

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& flag) -> bool {
            return i + 1 < argc && flag == arg;
        };

        if (needValue("--config")) {
            options.configFile = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        }
        else if (needValue("--port")) {
            if (!parsePort(argv[++i], options.port)) {
                return nlk::Err<Options>(nlk::ErrorCode::InvalidArgument, std::string("Invalid port: ") + argv[i]);
            }
        }
        else if (needValue("--output-dir") && options.command == Command::Receive) {
            options.outputDir = argv[++i];
        }
        else if (arg == "--advertise" && options.command == Command::Receive) {
            options.advertise = true;
        }
        else if (needValue("--host") && options.command == Command::Send) {
            options.host = argv[++i];
        }
        else if (needValue("--peer") && options.command == Command::Send) {
            options.peerName = argv[++i];
        }
        else if (arg == "--legacy" && options.command == Command::Send) {
            options.protocol = "legacy";
        }
        else if (arg == "--multi" && options.command == Command::Send) {
            options.protocol = "multi";
        }
        else if (arg == "--fresh" && options.command == Command::Send) {
            options.fresh = true;
        }
        else if (needValue("--name")) {
            options.name = argv[++i];
        }
        else if (needValue("--filter")) {
            options.filter = argv[++i];
        }
        else if (arg == "--broadcast-only") {
            options.broadcastOnly = true;
        }
        else if (needValue("--target")) {
            options.targets.push_back(argv[++i]);
        }
        else if (needValue("--duration")) {
            try {
                options.durationSec = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                return nlk::Err<Options>(nlk::ErrorCode::InvalidArgument, std::string("Invalid duration: ") + argv[i]);
            }
        }
        else if (arg == "--help") {
            options.command = Command::Help;
            return nlk::Ok(options);
        }
        else if (options.command == Command::Send && !arg.empty() && arg[0] != '-') {
            options.paths.push_back(arg);
        }
        else {
            return nlk::Err<Options>(nlk::ErrorCode::InvalidArgument, "Unknown option: " + arg);
        }
    }

    if (options.command == Command::Send) {
        if (options.host.empty() && options.peerName.empty()) {
            return nlk::Err<Options>(nlk::ErrorCode::InvalidArgument, "send needs --host or --peer");
        }
        if (options.paths.empty()) {
            return nlk::Err<Options>(nlk::ErrorCode::InvalidArgument, "send needs at least one path");
        }
    }

    return nlk::Ok(options);
}

void CLI::applyOverrides(const Options& options, Config& config) {
    if (options.port >= 0) {
        config.setInt(options.command == Command::Discover ? "discovery_port" : "listen_port", options.port);
    }
    if (!options.outputDir.empty()) config.set("output_root", options.outputDir);
    if (!options.protocol.empty()) config.set("protocol", options.protocol);
    if (options.fresh) config.setBool("resume_partial", false);
    if (!options.name.empty()) config.set("machine_name", options.name);
    if (!options.filter.empty()) config.set("discovery_ip_filter", options.filter);
    if (options.broadcastOnly) config.setBool("broadcast_only", true);
    if (!options.targets.empty()) {
        std::string joined;
        for (const auto& target : options.targets) {
            if (!joined.empty()) joined += ",";
            joined += target;
        }
        config.set("unicast_targets", joined);
    }
    if (options.verbose) config.set("log_level", "DEBUG");
}

nlk::Result<Config> CLI::loadConfig(const Options& options) {
    Config config;

    std::vector<std::string> layers = {"/etc/netlink/netlink.conf"};
    if (const char* home = std::getenv("HOME")) {
        layers.push_back(std::string(home) + "/.config/netlink/netlink.conf");
    }
    config.loadLayered(layers);

    if (!options.configFile.empty() && !config.loadFromFile(options.configFile)) {
        return nlk::Err<Config>(nlk::ErrorCode::MissingConfig, "Cannot read config file " + options.configFile);
    }

    applyOverrides(options, config);
    return nlk::Ok(config);
}

void CLI::configureLogging(const Options& options, const AppSettings& settings) {
    auto& logger = Logger::instance();
    logger.setComponent("netlink");
    logger.setLevel(options.verbose ? LogLevel::DEBUG : settings.logLevel);
    if (!settings.logFile.empty() && !logger.setLogFile(settings.logFile)) {
        std::cerr << "Warning: cannot open log file " << settings.logFile << std::endl;
    }
}

int CLI::run(const Options& options) {
    if (options.command == Command::Help) {
        printUsage();
        return 0;
    }
    if (options.command == Command::Version) {
        printVersion();
        return 0;
    }

    auto config = loadConfig(options);
    if (!config) {
        std::cerr << "Error: " << config.error().message << std::endl;
        return 1;
    }

    auto settings = AppSettings::fromConfig(*config);
    if (!settings) {
        std::cerr << "Error: " << settings.error().message << std::endl;
        return 1;
    }

    configureLogging(options, *settings);
    installSignalHandlers();

    switch (options.command) {
        case Command::Receive: return runReceive(options, *settings);
        case Command::Send: return runSend(options, *settings);
        case Command::Discover: return runDiscover(options, *settings);
        default: break;
    }
    printUsage();
    return 1;
}

int CLI::runReceive(const Options& options, const AppSettings& settings) {
    TransferServer server(settings.server);

    if (settings.partialMaxAgeDays > 0) {
        size_t removed = server.cleanupPartialFiles(std::chrono::hours(24 * settings.partialMaxAgeDays));
        if (removed > 0) {
            std::cout << "Removed " << removed << " stale partial file(s)" << std::endl;
        }
    }

    server.setCompletionCallback([](const CompletionRecord& record) {
        std::cout << (record.success ? "[OK] " : "[FAILED] ") << record.summary() << std::endl;
    });

    auto started = server.start();
    if (!started) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return 1;
    }
    std::cout << "Receiving into " << settings.server.outputRoot << " on port " << server.port()
              << " (Ctrl+C to stop)" << std::endl;

    std::unique_ptr<DiscoveryService> discovery;
    if (options.advertise) {
        DiscoveryConfig discoveryConfig = settings.discovery;
        discoveryConfig.receivePort = server.port();
        discovery = std::make_unique<DiscoveryService>(discoveryConfig);
        auto announced = discovery->start();
        if (!announced) {
            std::cerr << "Warning: discovery unavailable: " << announced.error().message << std::endl;
            discovery.reset();
        }
    }

    waitForSignal(options.durationSec);

    if (discovery) discovery->stop();
    server.stop();
    std::cout << MetricsCollector::instance().getMetricsSummary() << std::endl;
    return 0;
}

int CLI::runSend(const Options& options, const AppSettings& settings) {
    std::string host = options.host;
    int port = settings.server.port;

    if (host.empty()) {
        DiscoveryConfig discoveryConfig = settings.discovery;
        discoveryConfig.advertise = false;
        DiscoveryService discovery(discoveryConfig);
        auto started = discovery.start();
        if (!started) {
            std::cerr << "Error: " << started.error().message << std::endl;
            return 1;
        }

        std::cout << "Looking for peer '" << options.peerName << "'..." << std::endl;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings.discovery.peerTtlMs);
        std::optional<Peer> peer;
        while (!signalReceived && std::chrono::steady_clock::now() < deadline) {
            peer = discovery.findPeer(options.peerName);
            if (peer) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        discovery.stop();

        if (!peer) {
            std::cerr << "Error: peer '" << options.peerName << "' not found" << std::endl;
            return 1;
        }
        host = peer->ipAddress;
        port = peer->port;
    }

    TransferClient client(host, port, settings.client);

    int lastPercent = -1;
    ProgressCallback progress = [&lastPercent](uint64_t done, uint64_t total, const std::string& file) {
        int percent = total > 0 ? static_cast<int>(done * 100 / total) : 100;
        if (percent != lastPercent) {
            lastPercent = percent;
            std::cerr << "\r" << std::setw(3) << percent << "%  " << file << "\033[K" << std::flush;
        }
    };

    // Ctrl+C closes the connection and stops retrying
    std::atomic<bool> finished{false};
    std::thread watcher([&client, &finished] {
        while (!finished) {
            if (signalReceived) {
                client.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    nlk::Result<SendSummary> result = options.paths.size() == 1
        ? client.sendPath(options.paths.front(), progress)
        : client.sendMultipleFiles(options.paths, progress);

    finished = true;
    watcher.join();
    std::cerr << std::endl;

    if (!result) {
        std::cerr << "Transfer failed: " << result.error().message << std::endl;
        return 1;
    }

    std::cout << "Sent " << result->files.size() << " file(s), " << formatSize(result->totalBytes)
              << " to " << host << ":" << port;
    if (result->resumedBytes > 0) {
        std::cout << " (resumed " << formatSize(result->resumedBytes) << ")";
    }
    std::cout << std::endl;
    return 0;
}

int CLI::runDiscover(const Options& options, const AppSettings& settings) {
    DiscoveryService discovery(settings.discovery);
    discovery.setPeersChangedCallback([](const std::vector<Peer>& peers) {
        printPeers(peers);
    });

    auto started = discovery.start();
    if (!started) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return 1;
    }

    std::cout << "Announcing as '" << discovery.machineName() << "', listening for peers (Ctrl+C to stop)"
              << std::endl;
    waitForSignal(options.durationSec);

    discovery.stop();
    printPeers(discovery.getPeers());
    return 0;
}

void CLI::printUsage() {
    std::cout << R"(
Usage: netlink <command> [OPTIONS]

Commands:
  receive                 Accept incoming transfers
    --port <PORT>         TCP port (default: 5000)
    --output-dir <DIR>    Where received files go (default: received)
    --advertise           Announce this receiver on the LAN

  send [OPTIONS] PATH...  Send files or directories
    --host <HOST>         Receiver address
    --peer <NAME>         Receiver discovered by machine name
    --port <PORT>         Receiver port (default: 5000)
    --multi | --legacy    Use a non-resumable protocol variant
    --fresh               Ignore partial files on the receiver

  discover                Announce this host and list peers
    --name <NAME>         Machine name to announce
    --port <PORT>         UDP discovery port (default: 5007)
    --filter <PREFIX>     Only accept peers whose IP starts with PREFIX
    --broadcast-only      Skip multicast
    --target <IP[:PORT]>  Extra unicast beacon target (repeatable)
    --duration <SEC>      Stop after SEC seconds

Common options:
  --config <FILE>         Configuration file
  --verbose               Verbose logging
  --help                  Show this help
  --version               Show version
)" << std::endl;
}

void CLI::printVersion() {
    std::cout << "netlink v" << Version::describe() << std::endl;
}

} // namespace NetLink
