#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "chunkvault/protocol.hpp"
#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/streaming_sink.hpp"

namespace chunkvault::server
{

    using Clock = std::chrono::steady_clock;

    // State of one in-flight upload. Fields below mutex are only touched with it held;
    // status and received_size are also readable without it.
    struct UploadSession
    {
        std::string session_id;
        std::string owner_id;
        std::uint64_t total_size{};
        ObjectMetadata metadata;
        Clock::time_point created_at{};

        std::atomic<std::uint64_t> received_size{0};
        std::atomic<protocol::UploadStatus> status{protocol::UploadStatus::Pending};

        std::mutex mutex;
        std::unique_ptr<StreamingSink> sink;
        Clock::time_point last_activity{};
    };

    struct SessionSnapshot
    {
        std::string session_id;
        std::string owner_id;
        protocol::UploadStatus status{protocol::UploadStatus::Pending};
        std::uint64_t received_size{};
        std::uint64_t total_size{};
    };

} // namespace chunkvault::server
