// SPDX-License-Identifier: Apache-2.0
#include "ServerConfig.hpp"

#include <core/JsonUtils.hpp>
#include <mcp/Url.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace mcpvisor
{

namespace
{
    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
    }

    auto isValidId(std::string_view id) -> bool
    {
        return std::ranges::all_of(
            id, [](unsigned char c) { return std::isalnum(c) != 0 || c == '-' || c == '_'; });
    }

    auto inRange(std::chrono::milliseconds value, int64_t low, int64_t high) -> bool
    {
        return value.count() >= low && value.count() <= high;
    }

    auto healthCheckToJson(const HealthCheckConfig& healthCheck) -> nlohmann::json
    {
        return nlohmann::json {
            { "interval", healthCheck.interval.count() },
            { "timeout", healthCheck.timeout.count() },
            { "failureThreshold", healthCheck.failureThreshold },
        };
    }

    auto expectType(const nlohmann::json& value, std::string_view key, bool (nlohmann::json::*check)() const noexcept,
                    std::string_view typeName) -> VoidResult
    {
        auto const it = value.find(std::string(key));
        if (it == value.end() || it->is_null() || ((*it).*check)())
            return {};
        return makeError(ErrorCode::ConfigError, std::format("Field '{}' must be {}", key, typeName));
    }
} // namespace

auto applyUpdate(ServerConfig config, const ServerConfigUpdate& update) -> ServerConfig
{
    if (update.name)
        config.name = *update.name;
    if (update.description)
        config.description = *update.description;
    if (update.transport)
        config.transport = *update.transport;
    if (update.command)
        config.command = *update.command;
    if (update.args)
        config.args = *update.args;
    if (update.env)
        config.env = *update.env;
    if (update.cwd)
        config.cwd = *update.cwd;
    if (update.url)
        config.url = *update.url;
    if (update.autoRestart)
        config.autoRestart = *update.autoRestart;
    if (update.maxRestarts)
        config.maxRestarts = *update.maxRestarts;
    if (update.startupTimeout)
        config.startupTimeout = *update.startupTimeout;
    if (update.shutdownTimeout)
        config.shutdownTimeout = *update.shutdownTimeout;
    if (update.healthCheck)
        config.healthCheck = *update.healthCheck;
    if (update.tags)
        config.tags = *update.tags;
    if (update.enabled)
        config.enabled = *update.enabled;
    if (update.version)
        config.version = *update.version;
    return config;
}

auto validateServerConfig(const ServerConfig& config) -> std::vector<std::string>
{
    auto errors = std::vector<std::string> {};

    if (config.id.empty())
        errors.emplace_back("Server ID is required");
    else if (!isValidId(config.id))
        errors.emplace_back("Server ID must contain only alphanumeric characters, hyphens, and underscores");

    if (!config.name.empty() && isBlank(config.name))
        errors.emplace_back("Server name cannot be empty");

    if (config.transport == TransportKind::Stdio)
    {
        if (config.command.empty())
            errors.emplace_back("Server command is required for STDIO transport");
        else if (isBlank(config.command))
            errors.emplace_back("Server command cannot be empty");
    }

    if (config.transport == TransportKind::Sse && config.url.empty())
        errors.emplace_back("URL is required for SSE transport");

    if (!config.url.empty() && !parseUrl(config.url))
        errors.emplace_back("Transport URL must be a valid URL");

    if (config.maxRestarts < 0 || config.maxRestarts > 100)
        errors.emplace_back("Max restarts must be between 0 and 100");

    if (!inRange(config.startupTimeout, 1000, 60000))
        errors.emplace_back("Startup timeout must be between 1 and 60 seconds");

    if (!inRange(config.shutdownTimeout, 1000, 30000))
        errors.emplace_back("Shutdown timeout must be between 1 and 30 seconds");

    if (config.healthCheck)
    {
        if (!inRange(config.healthCheck->interval, 5000, 300000))
            errors.emplace_back("Health check interval must be between 5 seconds and 5 minutes");
        if (!inRange(config.healthCheck->timeout, 1000, 30000))
            errors.emplace_back("Health check timeout must be between 1 and 30 seconds");
        if (config.healthCheck->failureThreshold < 1 || config.healthCheck->failureThreshold > 10)
            errors.emplace_back("Health check failure threshold must be between 1 and 10");
    }

    if (std::ranges::any_of(config.env, [](const auto& entry) { return entry.first.empty(); }))
        errors.emplace_back("Environment variable names must not be empty");

    return errors;
}

auto checkServerConfig(const ServerConfig& config) -> VoidResult
{
    auto const errors = validateServerConfig(config);
    if (errors.empty())
        return {};

    auto message = std::string("Invalid server configuration");
    if (!config.id.empty())
        message += std::format(" '{}'", config.id);
    for (size_t i = 0; i < errors.size(); ++i)
        message += std::format("{} {}", i == 0 ? ":" : ";", errors[i]);
    return makeError(ErrorCode::ConfigValidationError, std::move(message));
}

auto makeStdioServerConfig(std::string id, std::string command, std::vector<std::string> args) -> ServerConfig
{
    auto config = ServerConfig {};
    config.id = std::move(id);
    config.transport = TransportKind::Stdio;
    config.command = std::move(command);
    config.args = std::move(args);
    return config;
}

auto makeSocketServerConfig(std::string id, std::string url) -> ServerConfig
{
    auto config = ServerConfig {};
    config.id = std::move(id);
    config.transport = TransportKind::Sse;
    config.url = std::move(url);
    return config;
}

auto toJson(const ServerConfig& config) -> nlohmann::json
{
    auto transport = nlohmann::json { { "type", transportKindName(config.transport) } };
    if (!config.url.empty())
        transport["url"] = config.url;

    auto value = nlohmann::json {
        { "id", config.id },
        { "name", config.displayName() },
        { "command", config.command },
        { "args", config.args },
        { "env", config.env },
        { "transport", std::move(transport) },
        { "autoRestart", config.autoRestart },
        { "maxRestarts", config.maxRestarts },
        { "startupTimeout", config.startupTimeout.count() },
        { "shutdownTimeout", config.shutdownTimeout.count() },
        { "enabled", config.enabled },
        { "tags", config.tags },
    };

    if (!config.description.empty())
        value["description"] = config.description;
    if (!config.cwd.empty())
        value["cwd"] = config.cwd;
    if (!config.version.empty())
        value["version"] = config.version;
    value["healthCheck"] = config.healthCheck ? healthCheckToJson(*config.healthCheck) : nlohmann::json(nullptr);

    return value;
}

auto serverConfigFromJson(const nlohmann::json& value, std::string_view fallbackId) -> Result<ServerConfig>
{
    if (!value.is_object())
        return makeError(ErrorCode::ConfigError, "Server configuration must be a JSON object");

    using Json = nlohmann::json;
    for (auto const& check: {
             expectType(value, "id", &Json::is_string, "a string"),
             expectType(value, "name", &Json::is_string, "a string"),
             expectType(value, "description", &Json::is_string, "a string"),
             expectType(value, "command", &Json::is_string, "a string"),
             expectType(value, "cwd", &Json::is_string, "a string"),
             expectType(value, "version", &Json::is_string, "a string"),
             expectType(value, "args", &Json::is_array, "an array of strings"),
             expectType(value, "tags", &Json::is_array, "an array of strings"),
             expectType(value, "env", &Json::is_object, "an object of strings"),
             expectType(value, "transport", &Json::is_object, "an object"),
             expectType(value, "autoRestart", &Json::is_boolean, "a boolean"),
             expectType(value, "enabled", &Json::is_boolean, "a boolean"),
             expectType(value, "maxRestarts", &Json::is_number_integer, "an integer"),
             expectType(value, "startupTimeout", &Json::is_number_integer, "an integer"),
             expectType(value, "shutdownTimeout", &Json::is_number_integer, "an integer"),
         })
    {
        if (!check)
            return std::unexpected(check.error());
    }

    auto config = ServerConfig {};
    config.id = json::getStringOr(value, "id", fallbackId);
    config.name = json::getStringOr(value, "name", "");
    config.description = json::getStringOr(value, "description", "");
    config.command = json::getStringOr(value, "command", "");
    config.args = json::getStringArray(value, "args");
    config.env = json::getStringMap(value, "env");
    config.cwd = json::getStringOr(value, "cwd", "");
    config.autoRestart = json::getBoolOr(value, "autoRestart", config.autoRestart);
    config.maxRestarts = json::getIntOr(value, "maxRestarts", config.maxRestarts);
    config.startupTimeout = json::getMillisOr(value, "startupTimeout", config.startupTimeout);
    config.shutdownTimeout = json::getMillisOr(value, "shutdownTimeout", config.shutdownTimeout);
    config.enabled = json::getBoolOr(value, "enabled", config.enabled);
    config.tags = json::getStringArray(value, "tags");
    config.version = json::getStringOr(value, "version", "");

    if (auto const it = value.find("transport"); it != value.end() && it->is_object())
    {
        auto const type = json::getStringOr(*it, "type", "stdio");
        auto const kind = transportKindFromString(type);
        if (!kind)
            return makeError(ErrorCode::ConfigError,
                             std::format("Transport type must be either \"stdio\" or \"sse\", got \"{}\"", type));
        config.transport = *kind;
        config.url = json::getStringOr(*it, "url", "");
    }

    if (auto const it = value.find("healthCheck"); it != value.end())
    {
        if (it->is_null() || (it->is_boolean() && !it->get<bool>()))
        {
            config.healthCheck = std::nullopt;
        }
        else if (it->is_object())
        {
            auto healthCheck = HealthCheckConfig {};
            healthCheck.interval = json::getMillisOr(*it, "interval", healthCheck.interval);
            healthCheck.timeout = json::getMillisOr(*it, "timeout", healthCheck.timeout);
            healthCheck.failureThreshold = json::getIntOr(*it, "failureThreshold", healthCheck.failureThreshold);
            config.healthCheck = healthCheck;
        }
        else if (!it->is_boolean())
        {
            return makeError(ErrorCode::ConfigError, "Field 'healthCheck' must be an object, null or false");
        }
    }

    return config;
}

auto serverTemplates() -> const std::map<std::string, ServerTemplate>&
{
    static auto const templates = std::map<std::string, ServerTemplate> {
        { "everything-server",
          ServerTemplate {
              .name = "Everything Server",
              .description = "Test server with various tool examples",
              .command = "npx",
              .args = { "@modelcontextprotocol/server-everything" },
              .tags = { "test", "examples" },
          } },
        { "filesystem-server",
          ServerTemplate {
              .name = "Filesystem Server",
              .description = "Server for file system operations",
              .command = "npx",
              .args = { "@modelcontextprotocol/server-filesystem" },
              .tags = { "filesystem", "files" },
          } },
        { "git-server",
          ServerTemplate {
              .name = "Git Server",
              .description = "Server for Git operations",
              .command = "npx",
              .args = { "@modelcontextprotocol/server-git" },
              .tags = { "git", "version-control" },
          } },
        { "postgres-server",
          ServerTemplate {
              .name = "PostgreSQL Server",
              .description = "Server for PostgreSQL database operations",
              .command = "npx",
              .args = { "@modelcontextprotocol/server-postgres" },
              .tags = { "database", "postgresql" },
          } },
    };
    return templates;
}

auto makeServerConfigFromTemplate(std::string_view templateId, std::string id) -> Result<ServerConfig>
{
    auto const& templates = serverTemplates();
    auto const it = templates.find(std::string(templateId));
    if (it == templates.end())
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown server template: {}", templateId));

    auto const& tmpl = it->second;
    auto config = makeStdioServerConfig(std::move(id), tmpl.command, tmpl.args);
    config.name = tmpl.name;
    config.description = tmpl.description;
    config.tags = tmpl.tags;
    return config;
}

} // namespace mcpvisor
