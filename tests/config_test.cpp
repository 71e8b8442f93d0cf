#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "filevault/config.hpp"
#include "test_helpers.hpp"

using namespace filevault;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
    }

    void TearDown() override {
        for (const auto& name : touched_) {
            ::unsetenv(name.c_str());
        }
    }

    void setEnv(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        touched_.push_back(name);
    }

private:
    std::vector<std::string> touched_;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutAnySource) {
    ConfigLoader loader;
    ServerConfig config = loader.build();

    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8008);
    EXPECT_EQ(config.threads, 4u);
    EXPECT_TRUE(config.uploadPassword.empty());
    EXPECT_EQ(config.storageDir, "data/file-server");
    EXPECT_EQ(config.maxFileSize, 524288000u);
    EXPECT_EQ(config.maxNameLength, 255u);
    EXPECT_TRUE(config.allowedExtensions.empty());
    EXPECT_EQ(config.blockedExtensions, defaultBlockedExtensions());
    EXPECT_TRUE(config.blockExecutableContent);
    EXPECT_TRUE(config.publicRead);
    EXPECT_EQ(config.logFile, "logs/server.log");
    EXPECT_EQ(config.maxPendingConnections, 256u);
    EXPECT_EQ(config.logMaxFileSize, 10u * 1024 * 1024);
    EXPECT_EQ(config.corsAllowOrigin, "*");
}

TEST_F(ConfigLoaderTest, ReadsNestedJson) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(R"({
        "server": {"host": "127.0.0.1", "port": 9090, "threads": 2, "base_url": "https://files.example.test/"},
        "auth": {"upload_password": "hunter2"},
        "storage": {
            "dir": "/srv/files",
            "max_file_size": 1048576,
            "allowed_extensions": ["PDF", ".png", ""],
            "blocked_extensions": [],
            "public_read": false
        },
        "logging": {"level": "DEBUG", "file": ""}
    })"));

    ServerConfig config = loader.build();

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.threads, 2u);
    EXPECT_EQ(config.baseUrl, "https://files.example.test");
    EXPECT_EQ(config.uploadPassword, "hunter2");
    EXPECT_EQ(config.storageDir, "/srv/files");
    EXPECT_EQ(config.maxFileSize, 1048576u);
    EXPECT_EQ(config.allowedExtensions, (std::set<std::string>{"pdf", "png"}));
    EXPECT_TRUE(config.blockedExtensions.empty());
    EXPECT_FALSE(config.publicRead);
    EXPECT_EQ(config.logLevel, "DEBUG");
    EXPECT_EQ(config.logFile, "");
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(R"({"server": {"port": 9090}, "auth": {"upload_password": "from-file"}})"));

    setEnv("PORT", " 7070 ");
    setEnv("UPLOAD_PASSWORD", "from-env");
    setEnv("BLOCKED_EXTENSIONS", "EXE, .Bat ,,sh");
    setEnv("PUBLIC_READ", "no");
    setEnv("MAX_FILE_SIZE", "12abc");
    setEnv("MAX_PENDING_CONNECTIONS", "0");
    setEnv("CORS_ALLOW_ORIGIN", "");
    loader.applyEnvironment();

    ServerConfig config = loader.build();

    EXPECT_EQ(config.port, 7070);
    EXPECT_EQ(config.uploadPassword, "from-env");
    EXPECT_EQ(config.blockedExtensions, (std::set<std::string>{"exe", "bat", "sh"}));
    EXPECT_FALSE(config.publicRead);
    // Non-numeric value is ignored
    EXPECT_EQ(config.maxFileSize, 524288000u);
    EXPECT_EQ(config.maxPendingConnections, 0u);
    EXPECT_TRUE(config.corsAllowOrigin.empty());
}

TEST_F(ConfigLoaderTest, LaterFilesMergeOverEarlierOnes) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(R"({"server": {"host": "10.0.0.1", "port": 9000}})"));
    ASSERT_TRUE(loader.loadFromString(R"({"server": {"port": 9001}})"));

    ServerConfig config = loader.build();
    EXPECT_EQ(config.host, "10.0.0.1");
    EXPECT_EQ(config.port, 9001);
}

TEST_F(ConfigLoaderTest, InvalidValuesFallBackToDefaults) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(R"({
        "server": {"port": 70000, "threads": 0},
        "storage": {"max_file_size": -5, "max_name_length": 4096}
    })"));

    ServerConfig config = loader.build();
    EXPECT_EQ(config.port, 8008);
    EXPECT_EQ(config.threads, 1u);
    EXPECT_EQ(config.maxFileSize, 524288000u);
    EXPECT_EQ(config.maxNameLength, 255u);
}

TEST_F(ConfigLoaderTest, RejectsMalformedDocuments) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.loadFromString("{not json"));
    EXPECT_FALSE(loader.loadFromString("[1, 2, 3]"));
    EXPECT_FALSE(loader.loadFromFile("/nonexistent/filevault/config.json"));
}

TEST_F(ConfigLoaderTest, ReadsFileFromDisk) {
    test::TempDir dir;
    auto path = dir.path() / "server_config.json";
    test::writeFile(path, R"({"storage": {"dir": "uploads", "block_executable_content": "off"}})");

    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromFile(path.string()));

    ServerConfig config = loader.build();
    EXPECT_EQ(config.storageDir, "uploads");
    EXPECT_FALSE(config.blockExecutableContent);
}

TEST_F(ConfigLoaderTest, TypedAccessorsAndSetValue) {
    ConfigLoader loader;
    loader.setValue("a.b.c", 42);
    loader.setValue("a.flag", std::string("yes"));
    loader.setValue("a.name", std::string("value"));

    EXPECT_EQ(loader.getInt("a.b.c"), 42);
    EXPECT_TRUE(loader.getBool("a.flag"));
    EXPECT_EQ(loader.getString("a.name"), "value");
    EXPECT_EQ(loader.getString("a.b.c", "fallback"), "fallback");
    EXPECT_EQ(loader.getInt("missing.key", 7), 7);
}

TEST(ExtensionListTest, Normalizes) {
    EXPECT_EQ(parseExtensionList(" .JPG, png,,  .Tar "), (std::set<std::string>{"jpg", "png", "tar"}));
    EXPECT_TRUE(parseExtensionList("").empty());
    EXPECT_EQ(defaultBlockedExtensions().count("exe"), 1u);
    EXPECT_EQ(defaultBlockedExtensions().count("pdf"), 0u);
}
