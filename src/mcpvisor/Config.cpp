// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpvisor
{

namespace
{

    auto readDocument(std::string_view path) -> Result<nlohmann::json>
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();

        auto parseResult = json::parse(ss.str());
        if (!parseResult)
            return withContext(parseResult.error(), std::format("Invalid config file {}", path));
        if (!parseResult->is_object())
            return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));
        return parseResult;
    }

    auto writeDocument(std::string_view path, const nlohmann::json& root) -> VoidResult
    {
        // Create parent directory if needed
        auto const dir = std::filesystem::path(path).parent_path();
        if (!dir.empty())
        {
            auto ec = std::error_code {};
            std::filesystem::create_directories(dir, ec);
            if (ec)
                return makeError(
                    ErrorCode::ConfigError,
                    std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
        }

        auto file = std::ofstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

        file << root.dump(4) << '\n';
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
        return {};
    }

    auto discoveryConfigFromJson(const nlohmann::json& value) -> DiscoveryConfig
    {
        auto const defaults = DiscoveryConfig {};
        auto config = DiscoveryConfig {};
        config.cacheTtl = json::getMillisOr(value, "cacheTtl", defaults.cacheTtl);
        config.discoveryInterval = json::getMillisOr(value, "discoveryInterval", defaults.discoveryInterval);
        config.autoDiscovery = json::getBoolOr(value, "autoDiscovery", defaults.autoDiscovery);
        config.maxToolsPerServer = static_cast<size_t>(
            std::max(0, json::getIntOr(value, "maxToolsPerServer", static_cast<int>(defaults.maxToolsPerServer))));
        config.validateSchemas = json::getBoolOr(value, "validateSchemas", defaults.validateSchemas);
        config.discoveryTimeout = json::getMillisOr(value, "discoveryTimeout", defaults.discoveryTimeout);
        return config;
    }

    auto discoveryConfigToJson(const DiscoveryConfig& config) -> nlohmann::json
    {
        return nlohmann::json {
            { "cacheTtl", config.cacheTtl.count() },
            { "discoveryInterval", config.discoveryInterval.count() },
            { "autoDiscovery", config.autoDiscovery },
            { "maxToolsPerServer", config.maxToolsPerServer },
            { "validateSchemas", config.validateSchemas },
            { "discoveryTimeout", config.discoveryTimeout.count() },
        };
    }

    // Reads the "mcpServers" object; the key of each entry is the server id.
    auto serversFromJson(const nlohmann::json& root) -> Result<std::map<std::string, ServerConfig>>
    {
        auto servers = std::map<std::string, ServerConfig> {};
        auto const it = root.find("mcpServers");
        if (it == root.end() || it->is_null())
            return servers;
        if (!it->is_object())
            return makeError(ErrorCode::ConfigError, "\"mcpServers\" must be an object keyed by server id");

        for (const auto& [id, serverJson]: it->items())
        {
            auto config = serverConfigFromJson(serverJson, id);
            if (!config)
                return withContext(config.error(), std::format("Server '{}'", id));
            config->id = id;
            servers.emplace(id, std::move(*config));
        }
        return servers;
    }

    auto serversToJson(const std::vector<ServerConfig>& configs) -> nlohmann::json
    {
        auto servers = nlohmann::json::object();
        for (const auto& config: configs)
        {
            auto value = toJson(config);
            value.erase("id");
            servers[config.id] = std::move(value);
        }
        return servers;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/mcpvisor";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcpvisor";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpvisor";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto appConfigFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto const defaults = AppConfig {};
    auto config = AppConfig {};

    config.logLevel = json::getStringOr(root, "logLevel", defaults.logLevel);
    if (!log::levelFromString(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", config.logLevel));

    config.requestTimeout = json::getMillisOr(root, "requestTimeout", defaults.requestTimeout);
    if (config.requestTimeout.count() <= 0)
        return makeError(ErrorCode::ConfigError, "\"requestTimeout\" must be positive");

    config.customPaths = json::getStringArray(root, "customPaths");
    config.autoSave = json::getBoolOr(root, "autoSave", defaults.autoSave);
    config.autoSaveDelay = json::getMillisOr(root, "autoSaveDelay", defaults.autoSaveDelay);

    if (root.contains("discovery"))
        config.discovery = discoveryConfigFromJson(root["discovery"]);

    auto servers = serversFromJson(root);
    if (!servers)
        return std::unexpected(servers.error());
    config.mcpServers = std::move(*servers);

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto document = readDocument(path);
    if (!document)
        return std::unexpected(document.error());

    auto config = appConfigFromJson(*document);
    if (!config)
        return withContext(config.error(), std::string(path));
    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto servers = std::vector<ServerConfig> {};
    for (const auto& [id, server]: config.mcpServers)
        servers.push_back(server);

    auto root = nlohmann::json {
        { "logLevel", config.logLevel },
        { "requestTimeout", config.requestTimeout.count() },
        { "customPaths", config.customPaths },
        { "autoSave", config.autoSave },
        { "autoSaveDelay", config.autoSaveDelay.count() },
        { "discovery", discoveryConfigToJson(config.discovery) },
        { "mcpServers", serversToJson(servers) },
    };

    return writeDocument(path, root);
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto makeManagerOptions(const AppConfig& config) -> ManagerOptions
{
    auto options = ManagerOptions {};
    options.discovery = config.discovery;
    options.server.customPaths = config.customPaths;
    options.server.requestTimeout = config.requestTimeout;
    options.autoSave = config.autoSave;
    options.autoSaveDelay = config.autoSaveDelay;
    return options;
}

JsonFileConfigStorage::JsonFileConfigStorage(std::string path): _path(std::move(path))
{
}

auto JsonFileConfigStorage::save(const std::vector<ServerConfig>& configs) -> VoidResult
{
    auto root = nlohmann::json::object();
    if (std::filesystem::exists(_path))
    {
        auto document = readDocument(_path);
        if (!document)
            return std::unexpected(document.error());
        root = std::move(*document);
    }

    root["mcpServers"] = serversToJson(configs);
    log::debug("Saving {} server configuration(s) to {}", configs.size(), _path);
    return writeDocument(_path, root);
}

auto JsonFileConfigStorage::load() -> Result<std::vector<ServerConfig>>
{
    auto configs = std::vector<ServerConfig> {};
    if (!std::filesystem::exists(_path))
        return configs;

    auto document = readDocument(_path);
    if (!document)
        return std::unexpected(document.error());

    auto servers = serversFromJson(*document);
    if (!servers)
        return std::unexpected(servers.error());

    for (auto& [id, config]: *servers)
        configs.push_back(std::move(config));
    return configs;
}

} // namespace mcpvisor
