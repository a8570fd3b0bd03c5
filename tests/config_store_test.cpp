#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "common/config_helpers.hpp"
#include "common/config_store.hpp"
#include "common/config_validation.hpp"
#include "discovery/discovery_config.hpp"

using namespace q2browse;
using q2browse::config::ConfigStore;
using namespace std::chrono_literals;

namespace {

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigStore::Initialize(discovery::DefaultConfigJson(), std::filesystem::path());
    }

    void TearDown() override {
        ConfigStore::Reset();
        if (!tempFile.empty()) {
            std::error_code ec;
            std::filesystem::remove(tempFile, ec);
        }
    }

    std::filesystem::path writeUserConfig(const std::string &contents) {
        tempFile = std::filesystem::temp_directory_path() /
                   ("q2browse_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".json");
        std::ofstream out(tempFile);
        out << contents;
        return tempFile;
    }

    std::filesystem::path tempFile;
};

} // namespace

TEST_F(ConfigStoreTest, DefaultsMatchDiscoveryConfig) {
    const auto config = discovery::LoadDiscoveryConfig();
    EXPECT_EQ(config.masterServerAddress, "master.quake2.com");
    EXPECT_EQ(config.masterServerPort, 27900);
    EXPECT_TRUE(config.useHttpMaster);
    EXPECT_EQ(config.httpMasterUrl, "http://q2servers.com/?raw=2");
    EXPECT_EQ(config.httpTimeout, 10s);
    EXPECT_TRUE(config.enableLanBroadcast);
    EXPECT_EQ(config.lanBroadcastAddress, "255.255.255.255");
    EXPECT_EQ(config.lanPort, 27910);
    EXPECT_EQ(config.lanListenWindow, 1500ms);
    EXPECT_EQ(config.maxConcurrentProbes, 75u);
    EXPECT_EQ(config.probeTimeout, 3000ms);

    EXPECT_TRUE(config::ValidateRequiredKeys(config::DiscoveryRequiredKeys()).empty());
}

TEST_F(ConfigStoreTest, DottedPathLookup) {
    const auto *url = ConfigStore::Get("discovery.Http.Url");
    ASSERT_NE(url, nullptr);
    EXPECT_EQ(url->get<std::string>(), "http://q2servers.com/?raw=2");
    EXPECT_EQ(ConfigStore::Get("discovery.Http.Missing"), nullptr);
    EXPECT_EQ(ConfigStore::Get("discovery..Url"), nullptr);
    EXPECT_FALSE(ConfigStore::GetCopy("probe.TimeoutMs.deeper").has_value());
}

TEST_F(ConfigStoreTest, RuntimeLayerOverridesAndRemoves) {
    const auto before = ConfigStore::Revision();
    ASSERT_TRUE(ConfigStore::AddRuntimeLayer("command line", {{"discovery", {{"Http", {{"Enabled", false}}}}}}));
    EXPECT_GT(ConfigStore::Revision(), before);

    auto config = discovery::LoadDiscoveryConfig();
    EXPECT_FALSE(config.useHttpMaster);
    EXPECT_EQ(config.httpMasterUrl, "http://q2servers.com/?raw=2");

    ASSERT_TRUE(ConfigStore::RemoveRuntimeLayer("command line"));
    config = discovery::LoadDiscoveryConfig();
    EXPECT_TRUE(config.useHttpMaster);
    EXPECT_FALSE(ConfigStore::RemoveRuntimeLayer("command line"));
}

TEST_F(ConfigStoreTest, SetRuntimeCreatesNestedValue) {
    ASSERT_TRUE(ConfigStore::SetRuntime("overrides", "probe.MaxConcurrent", 12));
    EXPECT_EQ(discovery::LoadDiscoveryConfig().maxConcurrentProbes, 12u);
    const auto *layer = ConfigStore::LayerByLabel("overrides");
    ASSERT_NE(layer, nullptr);
    EXPECT_EQ((*layer)["probe"]["MaxConcurrent"].get<int>(), 12);
}

TEST_F(ConfigStoreTest, OutOfRangeValuesAreClamped) {
    ConfigStore::AddRuntimeLayer("command line", {
        {"probe", {{"MaxConcurrent", 5000}, {"TimeoutMs", 0}}}
    });
    const auto config = discovery::LoadDiscoveryConfig();
    EXPECT_EQ(config.maxConcurrentProbes, 200u);
    EXPECT_EQ(config.probeTimeout, 1ms);
}

TEST_F(ConfigStoreTest, WrongTypesFallBackAndAreReported) {
    ConfigStore::AddRuntimeLayer("command line", {
        {"discovery", {{"Master", {{"Port", "not a port"}}}, {"Lan", {{"Enabled", "maybe"}}}}}
    });
    const auto config = discovery::LoadDiscoveryConfig();
    EXPECT_EQ(config.masterServerPort, 27900);
    EXPECT_TRUE(config.enableLanBroadcast);

    const auto issues = config::ValidateRequiredKeys(config::DiscoveryRequiredKeys());
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].path, "discovery.Master.Port");
    EXPECT_EQ(issues[1].path, "discovery.Lan.Enabled");
}

TEST_F(ConfigStoreTest, TypedHelpersAcceptStringForms) {
    ConfigStore::AddRuntimeLayer("command line", {
        {"discovery", {{"Lan", {{"Enabled", "off"}, {"Port", "27920"}}}}}
    });
    EXPECT_FALSE(config::ReadBoolConfig({"discovery.Lan.Enabled"}, true));
    EXPECT_EQ(config::ReadUInt16Config({"discovery.Lan.Port"}, 1), 27920);
    EXPECT_EQ(config::ReadIntConfig({"missing.key"}, 7), 7);
    EXPECT_EQ(config::ReadStringConfig("missing.key", "fallback"), "fallback");
}

TEST_F(ConfigStoreTest, UserConfigFileIsLayeredOverDefaults) {
    const auto path = writeUserConfig(R"({"discovery": {"Master": {"Address": "master.example.net", "Port": 27901}}})");
    ConfigStore::Initialize(discovery::DefaultConfigJson(), path);

    EXPECT_EQ(ConfigStore::UserConfigPath(), path);
    const auto config = discovery::LoadDiscoveryConfig();
    EXPECT_EQ(config.masterServerAddress, "master.example.net");
    EXPECT_EQ(config.masterServerPort, 27901);
    EXPECT_EQ(config.probeTimeout, 3000ms);
}

TEST_F(ConfigStoreTest, BrokenUserConfigIsIgnored) {
    const auto path = writeUserConfig("{ not json");
    ConfigStore::Initialize(discovery::DefaultConfigJson(), path);
    EXPECT_EQ(discovery::LoadDiscoveryConfig().masterServerAddress, "master.quake2.com");
}
