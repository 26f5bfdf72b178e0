#include "chunkvault/server/idle_reaper.hpp"

#include <spdlog/spdlog.h>

#include "chunkvault/server/upload_engine.hpp"

namespace chunkvault::server
{

    IdleReaper::IdleReaper(asio::io_context &io_context, UploadEngine &engine, std::chrono::seconds interval)
        : engine_(engine), interval_(interval), timer_(io_context)
    {
    }

    void IdleReaper::start()
    {
        running_ = true;
        schedule();
    }

    void IdleReaper::stop()
    {
        running_ = false;
        timer_.cancel();
    }

    void IdleReaper::schedule()
    {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const std::error_code &ec)
                          { on_timer(ec); });
    }

    void IdleReaper::on_timer(const std::error_code &ec)
    {
        if (ec == asio::error::operation_aborted || !running_)
        {
            return;
        }
        if (ec)
        {
            spdlog::warn("Idle reaper timer error: {}", ec.message());
        }
        else
        {
            try
            {
                const auto reaped = engine_.reap_idle();
                if (reaped > 0)
                {
                    spdlog::info("Reaped {} idle uploads, {} still active", reaped, engine_.registry().size());
                }
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Idle reap failed: {}", ex.what());
            }
        }
        schedule();
    }

} // namespace chunkvault::server
