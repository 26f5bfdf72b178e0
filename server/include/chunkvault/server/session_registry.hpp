#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chunkvault/server/upload_session.hpp"

namespace chunkvault::server
{

    class SessionRegistry
    {
    public:
        using ClockFunction = std::function<Clock::time_point()>;

        explicit SessionRegistry(ClockFunction clock = {});

        // Registers a pending session owning sink. Throws UploadError(Conflict) on an id collision.
        std::shared_ptr<UploadSession> create(const std::string &owner_id, std::uint64_t total_size,
                                              std::unique_ptr<StreamingSink> sink, ObjectMetadata metadata);

        // Throws UploadError(NotFound).
        std::shared_ptr<UploadSession> get(const std::string &session_id) const;

        std::shared_ptr<UploadSession> find(const std::string &session_id) const;

        void remove(const std::string &session_id);

        // Aborts, fails and removes every pending or uploading session idle for longer than max_idle.
        // Sessions busy with a chunk are left alone. Returns the number reaped.
        std::size_t reap_idle(Clock::duration max_idle);

        std::size_t abort_all(const std::string &reason);

        std::size_t size() const;
        std::vector<SessionSnapshot> snapshot() const;

        Clock::time_point now() const;

    private:
        std::string generate_session_id() const;

        ClockFunction clock_;
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions_;
    };

} // namespace chunkvault::server
