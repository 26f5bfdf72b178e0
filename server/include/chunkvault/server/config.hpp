#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "chunkvault/server/remote_blob_store.hpp"

namespace chunkvault::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds idle_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds reap_interval{std::chrono::seconds{60}};
        std::size_t high_water_mark{256 * 1024};
        std::size_t write_size{64 * 1024};
        std::uint64_t max_upload_size{5ULL * 1024 * 1024 * 1024};
        std::uint64_t remote_threshold{50ULL * 1024 * 1024};
        std::optional<RemoteStoreConfig> remote;
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
        bool show_help{false};
    };

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &)>;

    std::optional<std::string> process_environment(const std::string &name);

    // Flags override the --config file; CHUNKVAULT_REMOTE_* variables fill in remote credentials.
    // Throws ConfigError.
    ServerConfig parse_server_arguments(int argc, char *argv[],
                                        const EnvironmentLookup &environment = process_environment);

    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

    void apply_environment(ServerConfig &config, const EnvironmentLookup &environment);

    void validate(const ServerConfig &config);

    std::string usage(const char *program_name);

} // namespace chunkvault::server
