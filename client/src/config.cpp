#include "chunkvault/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace chunkvault::client
{

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto at_pos = endpoint.find('@');
        std::string host_part = endpoint;
        if (at_pos != std::string::npos)
        {
            config.owner = endpoint.substr(0, at_pos);
            host_part = endpoint.substr(at_pos + 1);
        }

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format [owner@]host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        const auto port_string = host_part.substr(colon_pos + 1);
        try
        {
            const auto port = std::stoul(port_string);
            if (port == 0 || port > 65535)
            {
                throw std::out_of_range("port");
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        catch (const std::logic_error &)
        {
            throw std::runtime_error("Invalid port: " + port_string);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--state")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--state requires a file path");
                }
                config.state_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--provider")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--provider requires local or remote");
                }
                config.provider = argv[index++];
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                config.chunk_size = static_cast<std::size_t>(std::stoull(argv[index++]));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (config.command.empty())
            {
                config.command = arg;
            }
            else
            {
                config.arguments.push_back(arg);
            }
        }

        if (config.command.empty())
        {
            throw std::runtime_error(usage());
        }
        return config;
    }

    std::string usage()
    {
        return "Usage: chunkvault-client [owner@]<host>:<port> <command> [args] [--log <file>] [--state <file>]\n"
               "Commands:\n"
               "  upload <file> [--provider local|remote] [--chunk-size <bytes>]\n"
               "  resume\n"
               "  status <session>\n"
               "  cancel <session>\n"
               "  download <provider>/<id> <file>\n"
               "  delete <provider>/<id>\n";
    }

} // namespace chunkvault::client
