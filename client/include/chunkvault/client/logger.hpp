#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace chunkvault::client
{

    /** Transfer log of one client run, appended to an optional file. */
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        // `level` is an spdlog level name; "off" suppresses the line, unknown names log at info.
        template <typename... Args>
        void log(std::string_view level, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            const auto severity = parse_level(level);
            if (severity == spdlog::level::off || !logger_->should_log(severity))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(severity, "{}", std::string_view(buf.data(), buf.size()));
        }

        bool enabled() const noexcept { return logger_ != nullptr; }

        static spdlog::level::level_enum parse_level(std::string_view level);

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace chunkvault::client
