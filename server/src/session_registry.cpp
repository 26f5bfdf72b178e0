#include "chunkvault/server/session_registry.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr std::size_t kSessionIdBytes = 16;
    } // namespace

    SessionRegistry::SessionRegistry(ClockFunction clock)
        : clock_(clock ? std::move(clock) : ClockFunction([]
                                                          { return Clock::now(); }))
    {
    }

    std::shared_ptr<UploadSession> SessionRegistry::create(const std::string &owner_id, std::uint64_t total_size,
                                                           std::unique_ptr<StreamingSink> sink,
                                                           ObjectMetadata metadata)
    {
        auto session = std::make_shared<UploadSession>();
        session->session_id = generate_session_id();
        session->owner_id = owner_id;
        session->total_size = total_size;
        session->metadata = std::move(metadata);
        session->created_at = now();
        session->last_activity = session->created_at;
        session->sink = std::move(sink);

        std::unique_lock lock(mutex_);
        const auto [it, inserted] = sessions_.emplace(session->session_id, session);
        if (!inserted)
        {
            lock.unlock();
            session->sink->abort("session id collision");
            throw UploadError(ErrorCode::Conflict, "Session id already in use");
        }
        return session;
    }

    std::shared_ptr<UploadSession> SessionRegistry::get(const std::string &session_id) const
    {
        auto session = find(session_id);
        if (!session)
        {
            throw UploadError(ErrorCode::NotFound, "Unknown upload session");
        }
        return session;
    }

    std::shared_ptr<UploadSession> SessionRegistry::find(const std::string &session_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    void SessionRegistry::remove(const std::string &session_id)
    {
        std::unique_lock lock(mutex_);
        sessions_.erase(session_id);
    }

    std::size_t SessionRegistry::reap_idle(Clock::duration max_idle)
    {
        std::vector<std::shared_ptr<UploadSession>> candidates;
        {
            std::shared_lock lock(mutex_);
            candidates.reserve(sessions_.size());
            for (const auto &[id, session] : sessions_)
            {
                candidates.push_back(session);
            }
        }

        const auto current = now();
        std::size_t reaped = 0;
        for (const auto &session : candidates)
        {
            std::unique_lock session_lock(session->mutex, std::try_to_lock);
            if (!session_lock.owns_lock())
            {
                // A chunk is being applied right now.
                continue;
            }
            if (protocol::is_terminal(session->status) || current - session->last_activity <= max_idle)
            {
                continue;
            }

            session->status = protocol::UploadStatus::Failed;
            if (session->sink)
            {
                session->sink->abort("idle timeout");
                session->sink.reset();
            }
            session_lock.unlock();

            remove(session->session_id);
            ++reaped;
            spdlog::info("Reaped idle upload {} for {} at {}/{} bytes", session->session_id, session->owner_id,
                         session->received_size.load(), session->total_size);
        }
        return reaped;
    }

    std::size_t SessionRegistry::abort_all(const std::string &reason)
    {
        std::unordered_map<std::string, std::shared_ptr<UploadSession>> sessions;
        {
            std::unique_lock lock(mutex_);
            sessions.swap(sessions_);
        }

        std::size_t aborted = 0;
        for (auto &[id, session] : sessions)
        {
            std::lock_guard session_lock(session->mutex);
            if (protocol::is_terminal(session->status))
            {
                continue;
            }
            session->status = protocol::UploadStatus::Failed;
            if (session->sink)
            {
                session->sink->abort(reason);
                session->sink.reset();
            }
            ++aborted;
        }
        return aborted;
    }

    std::size_t SessionRegistry::size() const
    {
        std::shared_lock lock(mutex_);
        return sessions_.size();
    }

    std::vector<SessionSnapshot> SessionRegistry::snapshot() const
    {
        std::shared_lock lock(mutex_);
        std::vector<SessionSnapshot> result;
        result.reserve(sessions_.size());
        for (const auto &[id, session] : sessions_)
        {
            result.push_back({
                .session_id = session->session_id,
                .owner_id = session->owner_id,
                .status = session->status,
                .received_size = session->received_size,
                .total_size = session->total_size,
            });
        }
        return result;
    }

    Clock::time_point SessionRegistry::now() const
    {
        return clock_();
    }

    std::string SessionRegistry::generate_session_id() const
    {
        return crypto::random_token(kSessionIdBytes);
    }

} // namespace chunkvault::server
