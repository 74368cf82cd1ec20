#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace snowgen::config;

namespace {

ConfigNode value(const std::string &key, const std::string &v)
{
    return ConfigNode{key, v, {}, NodeType::VALUE};
}

ConfigNode section(const std::string &key, std::vector<ConfigNode> children)
{
    return ConfigNode{key, "", std::move(children), NodeType::SECTION};
}

ConfigNode root(std::vector<ConfigNode> children)
{
    return ConfigNode{"config", "", std::move(children), NodeType::ROOT};
}

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }
};

TEST_F(ConfigTest, EmptyConfigurationUsesDefaults)
{
    Config config = parse<Config>(root({}));

    EXPECT_EQ(config.general.log_type, "console");
    EXPECT_EQ(config.general.log_facility, "user");
    EXPECT_EQ(config.general.log_priority, "info");
    EXPECT_EQ(config.generator.epoch, 1288834974657);
    EXPECT_FALSE(config.generator.node_id.has_value());
}

TEST_F(ConfigTest, DeserializesAllSections)
{
    Config config = parse<Config>(root({
        section("general", {value("log_type", "syslog"), value("log_facility", "daemon"),
                            value("log_priority", "debug")}),
        section("generator", {value("epoch", "1609459200000"), value("node_id", "512")}),
    }));

    EXPECT_EQ(config.general.log_type, "syslog");
    EXPECT_EQ(config.general.log_facility, "daemon");
    EXPECT_EQ(config.general.log_priority, "debug");
    EXPECT_EQ(config.generator.epoch, 1609459200000);
    ASSERT_TRUE(config.generator.node_id.has_value());
    EXPECT_EQ(*config.generator.node_id, 512);
}

TEST_F(ConfigTest, EmptyNodeIdMeansDerive)
{
    Config config = parse<Config>(root({section("generator", {value("node_id", "  ")})}));
    EXPECT_FALSE(config.generator.node_id.has_value());
}

TEST_F(ConfigTest, NodeIdBoundariesAreValidated)
{
    EXPECT_NO_THROW(parse<Config>(root({section("generator", {value("node_id", "0")})})));
    EXPECT_NO_THROW(parse<Config>(root({section("generator", {value("node_id", "1023")})})));
    EXPECT_THROW(parse<Config>(root({section("generator", {value("node_id", "1024")})})), std::invalid_argument);
    EXPECT_THROW(parse<Config>(root({section("generator", {value("node_id", "-1")})})), std::invalid_argument);
}

TEST_F(ConfigTest, MalformedNumbersAreRejected)
{
    EXPECT_THROW(parse<Config>(root({section("generator", {value("node_id", "12abc")})})), std::invalid_argument);
    EXPECT_THROW(parse<Config>(root({section("generator", {value("epoch", "soon")})})), std::invalid_argument);
}

TEST_F(ConfigTest, NegativeEpochIsRejected)
{
    EXPECT_THROW(parse<Config>(root({section("generator", {value("epoch", "-5")})})), std::invalid_argument);
}

TEST_F(ConfigTest, EpochAboveGeneratorLimitIsRejected)
{
    EXPECT_THROW(parse<Config>(root({section("generator", {value("epoch", "9223372036854775807")})})),
                 std::invalid_argument);
    EXPECT_NO_THROW(parse<Config>(root({section("generator", {value("epoch", std::to_string(snowgen::max_epoch))})})));
}

TEST_F(ConfigTest, InvalidLogTypeIsRejected)
{
    EXPECT_THROW(parse<Config>(root({section("general", {value("log_type", "file")})})), std::invalid_argument);
}

TEST_F(ConfigTest, GlobalKeysAreRejected)
{
    EXPECT_THROW(parse<Config>(root({value("epoch", "0")})), std::invalid_argument);
}

TEST_F(ConfigTest, UnknownSectionsAreIgnored)
{
    Config config;
    EXPECT_NO_THROW(config = parse<Config>(root({
                        section("future", {value("anything", "goes")}),
                        section("generator", {value("node_id", "7")}),
                    })));
    EXPECT_EQ(config.generator.node_id, std::optional<long long>(7));
}

TEST_F(ConfigTest, NonRootNodeIsRejected)
{
    EXPECT_THROW(deserialize<Config>(section("general", {})), std::invalid_argument);
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / "snowgen_config_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    std::filesystem::path writeTestFile(const std::string &filename, const std::string &content)
    {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
        return test_dir / filename;
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigFileTest, LoadsConfigurationFile)
{
    auto path = writeTestFile("snowgen.ini", R"([general]
log_type = console
log_priority = warning

[generator]
epoch = 1609459200000
node_id = 42
)");

    Config config = load(path);

    EXPECT_EQ(config.general.log_priority, "warning");
    EXPECT_EQ(config.generator.epoch, 1609459200000);
    EXPECT_EQ(config.generator.node_id, std::optional<long long>(42));
}

TEST_F(ConfigFileTest, MissingFileIsRuntimeError)
{
    EXPECT_THROW(load(test_dir / "does_not_exist.ini"), std::runtime_error);
}
