#include <gtest/gtest.h>
#include "Config.h"
#include <filesystem>
#include <fstream>
#include <map>

using namespace NetLink;
namespace fs = std::filesystem;

TEST(ConfigTest, BasicOperations) {
    Config config;

    config.set("key1", "value1");
    EXPECT_EQ(config.get("key1"), "value1");
    EXPECT_TRUE(config.hasKey("key1"));
    EXPECT_FALSE(config.hasKey("key2"));

    config.setInt("intKey", 42);
    EXPECT_EQ(config.getInt("intKey"), 42);

    config.setBool("boolKey", true);
    EXPECT_TRUE(config.getBool("boolKey"));

    config.set("broken", "12abc");
    EXPECT_EQ(config.getInt("broken", 5), 5);
    EXPECT_EQ(config.getSize("broken", 7u), 7u);
    EXPECT_EQ(config.originOf("key1"), "command line");
}

TEST(ConfigTest, ListValues) {
    Config config;
    config.set("unicast_targets", " 10.0.0.5 ,, 10.0.0.6:6007 ,");
    EXPECT_EQ(config.getList("unicast_targets"), (std::vector<std::string>{"10.0.0.5", "10.0.0.6:6007"}));
    EXPECT_TRUE(config.getList("missing").empty());
}

TEST(ConfigTest, LoadTracksOriginAndTrailingComments) {
    const fs::path file = fs::temp_directory_path() / "netlink_test_config.conf";
    {
        std::ofstream out(file);
        out << "listen_port = 8080   # receiver port\n";
        out << "output_root=/tmp/in#box\n";
        out << "not a setting\n";
    }

    Config loaded;
    ASSERT_TRUE(loaded.loadFromFile(file.string()));
    EXPECT_EQ(loaded.getInt("listen_port"), 8080);
    EXPECT_EQ(loaded.get("output_root"), "/tmp/in#box");
    EXPECT_EQ(loaded.originOf("listen_port"), file.string());
    EXPECT_FALSE(loaded.hasKey("not a setting"));

    fs::remove(file);
}

TEST(ConfigTest, LayeredLoadingAndComments) {
    const fs::path base = fs::temp_directory_path() / "netlink_test_base.conf";
    const fs::path user = fs::temp_directory_path() / "netlink_test_user.conf";
    {
        std::ofstream out(base);
        out << "# system defaults\n";
        out << "listen_port = 5000\n";
        out << "max_attempts = 3\n";
    }
    {
        std::ofstream out(user);
        out << "max_attempts = 5  \n";
    }

    Config config;
    ASSERT_TRUE(config.loadLayered({base.string(), "/nonexistent/netlink.conf", user.string()}));
    EXPECT_EQ(config.getInt("listen_port"), 5000);
    EXPECT_EQ(config.getInt("max_attempts"), 5);
    EXPECT_FALSE(config.hasKey("# system defaults"));

    fs::remove(base);
    fs::remove(user);
}

TEST(ConfigTest, ValidationNamesFailingKey) {
    Config config;
    config.set("port", "8080");

    std::map<std::string, Config::Validator> schema;
    schema["port"] = [](const std::string&, const std::string& v) {
        try {
            int port = std::stoi(v);
            return port > 0 && port < 65536;
        } catch (const std::exception&) {
            return false;
        }
    };

    schema["name"] = [](const std::string&, const std::string& v) { return !v.empty(); };

    EXPECT_TRUE(config.validate(schema));

    config.set("name", "");
    config.set("port", "70000");
    std::string failed;
    EXPECT_FALSE(config.validate(schema, &failed));
    EXPECT_EQ(failed, "name");
}
