#pragma once

#include <atomic>
#include <chrono>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace chunkvault::server
{

    class UploadEngine;

    // Calls UploadEngine::reap_idle every interval on the io_context until stopped.
    class IdleReaper
    {
    public:
        IdleReaper(asio::io_context &io_context, UploadEngine &engine, std::chrono::seconds interval);

        void start();
        void stop();

    private:
        void schedule();
        void on_timer(const std::error_code &ec);

        UploadEngine &engine_;
        std::chrono::seconds interval_;
        asio::steady_timer timer_;
        std::atomic<bool> running_{false};
    };

} // namespace chunkvault::server
