// SPDX-License-Identifier: Apache-2.0
#include <mcpvisor/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace mcpvisor;
using namespace std::chrono_literals;

namespace
{
/// A config file path in the temp directory that is removed again on scope exit.
struct TempConfigFile
{
    std::filesystem::path path;

    explicit TempConfigFile(std::string_view name): path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove(path);
    }
    ~TempConfigFile() { std::filesystem::remove(path); }

    void write(std::string_view contents) const
    {
        auto file = std::ofstream(path);
        file << contents;
    }

    [[nodiscard]] auto read() const -> nlohmann::json
    {
        auto file = std::ifstream(path);
        auto ss = std::stringstream {};
        ss << file.rdbuf();
        return nlohmann::json::parse(ss.str());
    }
};
} // namespace

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("/mcpvisor/config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.logLevel == "info");
    CHECK(config.requestTimeout == 30000ms);
    CHECK(config.customPaths.empty());
    CHECK(config.autoSave);
    CHECK(config.autoSaveDelay == 1000ms);
    CHECK(config.discovery.cacheTtl == 300000ms);
    CHECK(config.discovery.discoveryInterval == 60000ms);
    CHECK(config.discovery.maxToolsPerServer == 100);
    CHECK(config.mcpServers.empty());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const file = TempConfigFile { "mcpvisor_test_config.json" };
    file.write(R"({
        "logLevel": "debug",
        "requestTimeout": 15000,
        "customPaths": ["/opt/node/bin", "/usr/local/bin"],
        "autoSaveDelay": 250,
        "discovery": {
            "cacheTtl": 1000,
            "autoDiscovery": false,
            "maxToolsPerServer": 5
        },
        "mcpServers": {
            "test-server": {
                "command": "echo",
                "args": ["hello"],
                "env": {"KEY": "value"},
                "tags": ["demo"]
            },
            "remote": {
                "transport": {"type": "sse", "url": "http://localhost:8080/sse"},
                "healthCheck": null
            }
        }
    })");

    auto const result = loadConfigFromFile(file.path.string());
    REQUIRE(result.has_value());

    auto const& config = *result;
    CHECK(config.logLevel == "debug");
    CHECK(config.requestTimeout == 15000ms);
    CHECK(config.customPaths == std::vector<std::string> { "/opt/node/bin", "/usr/local/bin" });
    CHECK(config.autoSave);
    CHECK(config.autoSaveDelay == 250ms);
    CHECK(config.discovery.cacheTtl == 1000ms);
    CHECK(!config.discovery.autoDiscovery);
    CHECK(config.discovery.maxToolsPerServer == 5);
    CHECK(config.discovery.discoveryInterval == 60000ms);

    REQUIRE(config.mcpServers.size() == 2);
    auto const& server = config.mcpServers.at("test-server");
    CHECK(server.id == "test-server");
    CHECK(server.command == "echo");
    CHECK(server.args == std::vector<std::string> { "hello" });
    CHECK(server.env.at("KEY") == "value");
    CHECK(server.tags == std::vector<std::string> { "demo" });

    auto const& remote = config.mcpServers.at("remote");
    CHECK(remote.transport == TransportKind::Sse);
    CHECK(remote.url == "http://localhost:8080/sse");
    CHECK(!remote.healthCheck.has_value());

    auto const options = makeManagerOptions(config);
    CHECK(options.server.requestTimeout == 15000ms);
    CHECK(options.server.customPaths == config.customPaths);
    CHECK(options.autoSaveDelay == 250ms);
    CHECK(options.discovery.maxToolsPerServer == 5);
}

TEST_CASE("loadConfigFromFile returns error for missing file", "[config]")
{
    auto const result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const file = TempConfigFile { "mcpvisor_test_invalid.json" };
    file.write("{ not valid json }");

    auto const result = loadConfigFromFile(file.path.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
    CHECK(result.error().message.starts_with("Invalid config file"));
}

TEST_CASE("appConfigFromJson rejects bad values", "[config]")
{
    SECTION("unknown log level")
    {
        auto const result = appConfigFromJson({ { "logLevel", "loud" } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message == "Unknown log level 'loud'");
    }

    SECTION("non-positive request timeout")
    {
        auto const result = appConfigFromJson({ { "requestTimeout", 0 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("servers not keyed by id")
    {
        auto const result = appConfigFromJson({ { "mcpServers", nlohmann::json::array() } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("ill-typed server entry")
    {
        auto const result = appConfigFromJson({ { "mcpServers", { { "bad", { { "maxRestarts", "many" } } } } } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message == "Server 'bad': Field 'maxRestarts' must be an integer");
    }

    SECTION("not an object")
    {
        CHECK(!appConfigFromJson(nlohmann::json::array()).has_value());
    }
}

TEST_CASE("saveConfigToFile and loadConfigFromFile keep the configuration", "[config]")
{
    auto const file = TempConfigFile { "mcpvisor_test_saved.json" };

    auto config = AppConfig {};
    config.logLevel = "warning";
    config.customPaths = { "/opt/bin" };
    config.discovery.cacheTtl = 2000ms;
    auto server = makeStdioServerConfig("fs", "npx", { "@modelcontextprotocol/server-filesystem", "/tmp" });
    server.name = "Filesystem";
    config.mcpServers.emplace("fs", server);

    REQUIRE(saveConfigToFile(file.path.string(), config).has_value());

    auto const document = file.read();
    CHECK(document["mcpServers"].contains("fs"));
    CHECK(!document["mcpServers"]["fs"].contains("id"));

    auto const loaded = loadConfigFromFile(file.path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->logLevel == "warning");
    CHECK(loaded->customPaths == config.customPaths);
    CHECK(loaded->discovery.cacheTtl == 2000ms);
    REQUIRE(loaded->mcpServers.contains("fs"));
    CHECK(loaded->mcpServers.at("fs").name == "Filesystem");
    CHECK(loaded->mcpServers.at("fs").args == server.args);
}

TEST_CASE("JsonFileConfigStorage", "[config]")
{
    auto const file = TempConfigFile { "mcpvisor_test_storage.json" };
    auto storage = JsonFileConfigStorage { file.path.string() };

    SECTION("a missing file holds no servers")
    {
        auto const configs = storage.load();
        REQUIRE(configs.has_value());
        CHECK(configs->empty());
    }

    SECTION("saving keeps the other sections")
    {
        file.write(R"({"logLevel": "trace", "customPaths": ["/x"]})");

        auto remote = makeSocketServerConfig("remote", "http://localhost:3000/sse");
        REQUIRE(storage.save({ makeStdioServerConfig("local", "cat"), remote }).has_value());

        auto const document = file.read();
        CHECK(document["logLevel"] == "trace");
        CHECK(document["customPaths"] == nlohmann::json::array({ "/x" }));
        CHECK(document["mcpServers"].size() == 2);

        auto const configs = storage.load();
        REQUIRE(configs.has_value());
        REQUIRE(configs->size() == 2);
        CHECK((*configs)[0].id == "local");
        CHECK((*configs)[0].command == "cat");
        CHECK((*configs)[1].id == "remote");
        CHECK((*configs)[1].transport == TransportKind::Sse);
    }

    SECTION("a corrupt file is an error")
    {
        file.write("[1, 2");
        CHECK(!storage.load().has_value());
        CHECK(!storage.save({}).has_value());
    }
}
