#include "chunkvault/server/config.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/version.hpp"

namespace chunkvault::server
{

    namespace
    {

        constexpr std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info", "warn", "error", "critical",
                                                             "off"};

        std::uint64_t parse_number(const std::string &flag, const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto number = std::stoull(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    throw ConfigError("Invalid value for " + flag + ": " + value);
                }
                return number;
            }
            catch (const std::logic_error &)
            {
                throw ConfigError("Invalid value for " + flag + ": " + value);
            }
        }

        void apply_option(ServerConfig &config, const std::string &flag, const std::string &value)
        {
            if (flag == "--port")
            {
                const auto port = parse_number(flag, value);
                if (port > 65535)
                {
                    throw ConfigError("Port out of range: " + value);
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (flag == "--address")
            {
                config.address = value;
            }
            else if (flag == "--root")
            {
                config.root = std::filesystem::path(value);
            }
            else if (flag == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(parse_number(flag, value));
            }
            else if (flag == "--idle-timeout")
            {
                config.idle_timeout = std::chrono::seconds(parse_number(flag, value));
            }
            else if (flag == "--reap-interval")
            {
                config.reap_interval = std::chrono::seconds(parse_number(flag, value));
            }
            else if (flag == "--high-water-mark")
            {
                config.high_water_mark = static_cast<std::size_t>(parse_number(flag, value));
            }
            else if (flag == "--write-size")
            {
                config.write_size = static_cast<std::size_t>(parse_number(flag, value));
            }
            else if (flag == "--max-upload-size")
            {
                config.max_upload_size = parse_number(flag, value);
            }
            else if (flag == "--remote-threshold")
            {
                config.remote_threshold = parse_number(flag, value);
            }
            else if (flag == "--log")
            {
                config.log_file = std::filesystem::path(value);
            }
            else if (flag == "--log-level")
            {
                config.log_level = value;
            }
            else
            {
                throw ConfigError("Unknown argument: " + flag);
            }
        }

        void load_remote(const nlohmann::json &json, RemoteStoreConfig &remote)
        {
            remote.upload_url = json.value("upload_url", remote.upload_url);
            remote.files_url = json.value("files_url", remote.files_url);
            remote.token_url = json.value("token_url", remote.token_url);
            remote.folder_id = json.value("folder_id", remote.folder_id);
            remote.credentials.access_token = json.value("access_token", remote.credentials.access_token);
            remote.credentials.client_id = json.value("client_id", remote.credentials.client_id);
            remote.credentials.client_secret = json.value("client_secret", remote.credentials.client_secret);
            remote.credentials.refresh_token = json.value("refresh_token", remote.credentials.refresh_token);
            remote.upload_chunk_size = json.value("upload_chunk_size", remote.upload_chunk_size);
            remote.retry.max_retries = json.value("max_retries", remote.retry.max_retries);
            remote.retry.initial_delay =
                std::chrono::milliseconds(json.value("retry_delay_ms", remote.retry.initial_delay.count()));
        }

    } // namespace

    std::optional<std::string> process_environment(const std::string &name)
    {
        if (const char *value = std::getenv(name.c_str()))
        {
            return std::string(value);
        }
        return std::nullopt;
    }

    ServerConfig parse_server_arguments(int argc, char *argv[], const EnvironmentLookup &environment)
    {
        ServerConfig config;
        std::optional<std::filesystem::path> config_file;
        std::vector<std::pair<std::string, std::string>> options;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            if (!arg.starts_with("--"))
            {
                throw ConfigError("Unknown argument: " + arg);
            }
            if (i + 1 >= argc)
            {
                throw ConfigError("Missing value for " + arg);
            }
            std::string value = argv[++i];
            if (arg == "--config")
            {
                config_file = std::filesystem::path(value);
            }
            else
            {
                options.emplace_back(arg, std::move(value));
            }
        }

        if (config_file)
        {
            load_config_file(*config_file, config);
        }
        for (const auto &[flag, value] : options)
        {
            apply_option(config, flag, value);
        }
        apply_environment(config, environment);
        validate(config);
        return config;
    }

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("Cannot open config file " + path.string());
        }
        try
        {
            nlohmann::json json;
            in >> json;
            config.address = json.value("address", config.address);
            config.port = json.value("port", config.port);
            if (json.contains("root"))
            {
                config.root = json.at("root").get<std::string>();
            }
            config.worker_threads = json.value("threads", config.worker_threads);
            config.idle_timeout = std::chrono::seconds(json.value("idle_timeout", config.idle_timeout.count()));
            config.reap_interval = std::chrono::seconds(json.value("reap_interval", config.reap_interval.count()));
            config.high_water_mark = json.value("high_water_mark", config.high_water_mark);
            config.write_size = json.value("write_size", config.write_size);
            config.max_upload_size = json.value("max_upload_size", config.max_upload_size);
            config.remote_threshold = json.value("remote_threshold", config.remote_threshold);
            if (json.contains("log"))
            {
                config.log_file = std::filesystem::path(json.at("log").get<std::string>());
            }
            config.log_level = json.value("log_level", config.log_level);
            if (json.contains("remote") && json.at("remote").is_object())
            {
                RemoteStoreConfig remote = config.remote.value_or(RemoteStoreConfig{});
                load_remote(json.at("remote"), remote);
                config.remote = std::move(remote);
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ConfigError("Invalid config file " + path.string() + ": " + ex.what());
        }
    }

    void apply_environment(ServerConfig &config, const EnvironmentLookup &environment)
    {
        const std::array<std::pair<const char *, std::string RemoteCredentials::*>, 4> variables{{
            {"CHUNKVAULT_REMOTE_ACCESS_TOKEN", &RemoteCredentials::access_token},
            {"CHUNKVAULT_REMOTE_CLIENT_ID", &RemoteCredentials::client_id},
            {"CHUNKVAULT_REMOTE_CLIENT_SECRET", &RemoteCredentials::client_secret},
            {"CHUNKVAULT_REMOTE_REFRESH_TOKEN", &RemoteCredentials::refresh_token},
        }};
        for (const auto &[name, member] : variables)
        {
            auto value = environment(name);
            if (!value || value->empty())
            {
                continue;
            }
            if (!config.remote)
            {
                config.remote = RemoteStoreConfig{};
            }
            config.remote->credentials.*member = std::move(*value);
        }
    }

    void validate(const ServerConfig &config)
    {
        if (config.port == 0)
        {
            throw ConfigError("--port is required");
        }
        if (config.root.empty())
        {
            throw ConfigError("--root is required");
        }
        if (config.write_size == 0 || config.high_water_mark < config.write_size)
        {
            throw ConfigError("--high-water-mark must be at least --write-size, which must be positive");
        }
        if (config.max_upload_size == 0 || config.remote_threshold == 0)
        {
            throw ConfigError("Size limits must be positive");
        }
        if (config.idle_timeout.count() <= 0 || config.reap_interval.count() <= 0)
        {
            throw ConfigError("--idle-timeout and --reap-interval must be positive");
        }
        bool known_level = false;
        for (const auto level : kLogLevels)
        {
            known_level = known_level || level == config.log_level;
        }
        if (!known_level)
        {
            throw ConfigError("Unknown log level: " + config.log_level);
        }
        if (config.remote)
        {
            const auto &credentials = config.remote->credentials;
            if (credentials.access_token.empty() && credentials.refresh_token.empty())
            {
                throw ConfigError("Remote store needs an access token or a refresh token");
            }
            if (config.remote->upload_chunk_size == 0 ||
                config.remote->upload_chunk_size % config.remote->granularity != 0)
            {
                throw ConfigError("Remote upload_chunk_size must be a positive multiple of 256 KiB");
            }
        }
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream out;
        out << "chunkvault server " << chunkvault::version() << "\n"
            << "Usage: " << program_name
            << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>] [--idle-timeout <seconds>]\n"
               "       [--reap-interval <seconds>] [--high-water-mark <bytes>] [--write-size <bytes>]\n"
               "       [--max-upload-size <bytes>] [--remote-threshold <bytes>] [--config <FILE.json>]\n"
               "       [--log <FILE>] [--log-level <trace|debug|info|warn|error>]\n";
        return out.str();
    }

} // namespace chunkvault::server
