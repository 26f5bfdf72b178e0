#include "chunkvault/client/logger.hpp"

#include <iostream>

#include <spdlog/sinks/basic_file_sink.h>

namespace chunkvault::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            if (path->has_parent_path())
            {
                std::filesystem::create_directories(path->parent_path());
            }
            // Several runs append to the same file; the pid tells them apart.
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>("chunkvault-client", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [pid %P] %v");
            logger_->set_level(spdlog::level::debug);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "[warning] transfer log disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            std::cerr << "[warning] transfer log disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    spdlog::level::level_enum Logger::parse_level(std::string_view level)
    {
        // from_str answers off for names it does not know as well as for "off".
        const auto parsed = spdlog::level::from_str(std::string(level));
        if (parsed == spdlog::level::off && level != "off")
        {
            return spdlog::level::info;
        }
        return parsed;
    }

} // namespace chunkvault::client
