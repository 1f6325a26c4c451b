#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class VaultConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "kvault_config_test" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::create_directories(test_dir);
        unsetenv(ENV_DEBUG);
    }

    void TearDown() override {
        unsetenv(ENV_DEBUG);
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        fs::path p = test_dir / "kvault.yaml";
        std::ofstream(p) << content;
        return p;
    }
};

TEST_F(VaultConfigTest, EmptyScopeAttributesAreUnset) {
    Scope scope;
    scope.service_name = "";
    scope.access_group = "";
    VaultConfig config(scope);
    EXPECT_FALSE(config.scope().service_name.has_value());
    EXPECT_FALSE(config.scope().access_group.has_value());
    EXPECT_FALSE(config.verbose());
    EXPECT_FALSE(config.log_path().empty());
    EXPECT_FALSE(config.store_path().empty());
}

TEST_F(VaultConfigTest, ForApplicationUsesIdentity) {
    VaultConfig config = VaultConfig::for_application("com.example.app");
    ASSERT_TRUE(config.scope().service_name.has_value());
    EXPECT_EQ(*config.scope().service_name, "com.example.app");
    EXPECT_FALSE(config.scope().access_group.has_value());
}

TEST_F(VaultConfigTest, ForApplicationFallsBackWhenIdentityUnknown) {
    VaultConfig config = VaultConfig::for_application("");
    EXPECT_EQ(config.scope().service_name.value_or(""), DEFAULT_SERVICE_NAME);
}

TEST_F(VaultConfigTest, DebugEnvForcesVerbose) {
    setenv(ENV_DEBUG, "1", 1);
    EXPECT_TRUE(VaultConfig::for_application("x").verbose());
    setenv(ENV_DEBUG, "0", 1);
    EXPECT_FALSE(VaultConfig::for_application("x").verbose());
}

TEST_F(VaultConfigTest, LoadFullFile) {
    auto path = write_config(
        "service_name: app.test\n"
        "access_group: group.shared\n"
        "verbose: true\n"
        "log_path: " + (test_dir / "debug.log").string() + "\n"
        "store_path: " + (test_dir / "prefs.yaml").string() + "\n");

    auto result = VaultConfig::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const VaultConfig& c = result.value;
    EXPECT_EQ(c.scope().service_name.value_or(""), "app.test");
    EXPECT_EQ(c.scope().access_group.value_or(""), "group.shared");
    EXPECT_TRUE(c.verbose());
    EXPECT_EQ(c.log_path(), test_dir / "debug.log");
    EXPECT_EQ(c.store_path(), test_dir / "prefs.yaml");
}

TEST_F(VaultConfigTest, LoadMinimalFileUsesDefaults) {
    auto result = VaultConfig::load(write_config("service_name: app.test\n"));
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_FALSE(result.value.verbose());
    EXPECT_FALSE(result.value.scope().access_group.has_value());
    EXPECT_FALSE(result.value.store_path().empty());
}

TEST_F(VaultConfigTest, LoadEmptyFile) {
    auto result = VaultConfig::load(write_config(""));
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_FALSE(result.value.scope().service_name.has_value());
}

TEST_F(VaultConfigTest, LoadMissingFile) {
    auto result = VaultConfig::load(test_dir / "nope.yaml");
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST_F(VaultConfigTest, LoadRejectsBadShapes) {
    EXPECT_TRUE(VaultConfig::load(write_config("- just\n- a list\n")).is_err());
    EXPECT_TRUE(VaultConfig::load(write_config("service_name: [a, b]\n")).is_err());
    EXPECT_TRUE(VaultConfig::load(write_config("service_name: {unterminated\n")).is_err());
}

TEST_F(VaultConfigTest, LoadUnstatablePathIsAnError) {
    // Component longer than NAME_MAX makes stat fail with ENAMETOOLONG
    auto result = VaultConfig::load(test_dir / std::string(300, 'a') / "kvault.yaml");
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Cannot access"), std::string::npos);
}
