#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::client
{

    struct ClientConfig
    {
        std::optional<std::string> owner;
        std::string host;
        std::uint16_t port{};
        std::string command;
        std::vector<std::string> arguments;
        std::optional<std::string> provider;
        std::size_t chunk_size{8 * 1024 * 1024};
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> state_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace chunkvault::client
