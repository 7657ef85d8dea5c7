#pragma once

#include "AppSettings.h"
#include "Config.h"
#include "Result.h"
#include <string>
#include <vector>

namespace NetLink {

/**
 * @brief Command line front end: receive, send, discover
 */
class CLI {
public:
    enum class Command {
        Receive,
        Send,
        Discover,
        Help,
        Version
    };

    struct Options {
        Command command{Command::Help};
        std::string configFile;
        bool verbose{false};

        int port{-1};
        std::string outputDir;
        bool advertise{false};

        std::string host;
        std::string peerName;
        std::string protocol;
        bool fresh{false};
        std::vector<std::string> paths;

        std::string name;
        std::string filter;
        bool broadcastOnly{false};
        std::vector<std::string> targets;
        int durationSec{0};
    };

    static nlk::Result<Options> parseArguments(int argc, char* argv[]);

    /// Copy command line values over the file configuration
    static void applyOverrides(const Options& options, Config& config);

    static int run(const Options& options);

    static void printUsage();
    static void printVersion();

private:
    static int runReceive(const Options& options, const AppSettings& settings);
    static int runSend(const Options& options, const AppSettings& settings);
    static int runDiscover(const Options& options, const AppSettings& settings);

    static nlk::Result<Config> loadConfig(const Options& options);
    static void configureLogging(const Options& options, const AppSettings& settings);
};

} // namespace NetLink
