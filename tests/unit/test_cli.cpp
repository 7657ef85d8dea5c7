#include <gtest/gtest.h>
#include "CLI.h"
#include <vector>

using namespace NetLink;

namespace {

nlk::Result<CLI::Options> parse(std::vector<std::string> args) {
    args.insert(args.begin(), "netlink");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    return CLI::parseArguments(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(CLITest, NoArgumentsShowsHelp) {
    auto options = parse({});
    ASSERT_TRUE(options.ok());
    EXPECT_EQ(options->command, CLI::Command::Help);
}

TEST(CLITest, ReceiveOptions) {
    auto options = parse({"receive", "--port", "6001", "--output-dir", "/tmp/in", "--advertise", "--verbose"});
    ASSERT_TRUE(options.ok()) << options.error().message;
    EXPECT_EQ(options->command, CLI::Command::Receive);
    EXPECT_EQ(options->port, 6001);
    EXPECT_EQ(options->outputDir, "/tmp/in");
    EXPECT_TRUE(options->advertise);
    EXPECT_TRUE(options->verbose);
}

TEST(CLITest, SendCollectsPaths) {
    auto options = parse({"send", "--host", "10.0.0.2", "--multi", "a.txt", "photos"});
    ASSERT_TRUE(options.ok()) << options.error().message;
    EXPECT_EQ(options->command, CLI::Command::Send);
    EXPECT_EQ(options->host, "10.0.0.2");
    EXPECT_EQ(options->protocol, "multi");
    EXPECT_EQ(options->paths, (std::vector<std::string>{"a.txt", "photos"}));
}

TEST(CLITest, SendRequiresTargetAndPaths) {
    EXPECT_FALSE(parse({"send", "a.txt"}).ok());
    EXPECT_FALSE(parse({"send", "--host", "10.0.0.2"}).ok());
}

TEST(CLITest, RejectsUnknownInput) {
    auto command = parse({"teleport"});
    ASSERT_FALSE(command.ok());
    EXPECT_EQ(command.error().code, nlk::ErrorCode::InvalidArgument);

    EXPECT_FALSE(parse({"receive", "--bogus"}).ok());
    EXPECT_FALSE(parse({"receive", "--port", "99999"}).ok());
    EXPECT_FALSE(parse({"discover", "--advertise"}).ok());
}

TEST(CLITest, OverridesReachSettings) {
    auto options = parse({"discover", "--port", "6007", "--filter", "192.168.1.", "--broadcast-only",
                          "--target", "10.0.0.9:6007", "--name", "desk"});
    ASSERT_TRUE(options.ok()) << options.error().message;

    Config config;
    CLI::applyOverrides(*options, config);
    auto settings = AppSettings::fromConfig(config);
    ASSERT_TRUE(settings.ok()) << settings.error().message;

    EXPECT_EQ(settings->discovery.discoveryPort, 6007);
    EXPECT_EQ(settings->discovery.ipFilter, "192.168.1.");
    EXPECT_TRUE(settings->discovery.broadcastOnly);
    EXPECT_EQ(settings->discovery.machineName, "desk");
    EXPECT_EQ(settings->discovery.unicastTargets, std::vector<std::string>{"10.0.0.9:6007"});
}
