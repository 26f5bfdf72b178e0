#include "chunkvault/server/remote_blob_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/content_range.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kTokenRefreshMargin = std::chrono::seconds{60};
        constexpr int kMaxFinalizeAttempts = 8;

        UploadError remote_failure(std::string_view what, const HttpResponse &response)
        {
            auto message = std::string(what) + " failed with HTTP " + std::to_string(response.status);
            if (!response.body.empty())
            {
                message += ": " + response.body.substr(0, 256);
            }
            return UploadError(ErrorCode::StorageFailure, std::move(message));
        }

        bool is_remote_id(std::string_view id)
        {
            return !id.empty() && std::all_of(id.begin(), id.end(), [](char c)
                                              { return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_'; });
        }

        class RemoteBlobSink : public BlobSink
        {
        public:
            RemoteBlobSink(RemoteBlobStore &store, std::string session_uri, std::uint64_t total_size)
                : store_(store), session_uri_(std::move(session_uri)), total_size_(total_size),
                  chunk_size_(store.config().upload_chunk_size)
            {
            }

            ~RemoteBlobSink() override
            {
                if (!released_)
                {
                    abort();
                }
            }

            void write(std::span<const std::byte> data) override
            {
                pending_.append(reinterpret_cast<const char *>(data.data()), data.size());
                while (pending_.size() >= chunk_size_)
                {
                    auto response = put_range(chunk_size_, false);
                    if (response.status != 308)
                    {
                        throw remote_failure("Chunk upload", response);
                    }
                    commit(response, chunk_size_);
                }
            }

            ObjectHandle finalize() override
            {
                if (committed_ + pending_.size() != total_size_)
                {
                    throw UploadError(ErrorCode::StorageFailure,
                                      "Remote upload holds " + std::to_string(committed_ + pending_.size()) +
                                          " bytes, expected " + std::to_string(total_size_));
                }

                for (int attempt = 0; attempt < kMaxFinalizeAttempts; ++attempt)
                {
                    const auto length = pending_.size();
                    auto response = put_range(length, true);
                    if (response.status == 200 || response.status == 201)
                    {
                        const auto body = nlohmann::json::parse(response.body, nullptr, false);
                        if (body.is_discarded() || !body.contains("id") || !body.at("id").is_string())
                        {
                            throw UploadError(ErrorCode::StorageFailure, "Remote store returned no file id");
                        }
                        released_ = true;
                        return {
                            .provider = std::string(RemoteBlobStore::kProvider),
                            .id = body.at("id").get<std::string>(),
                            .size = total_size_,
                        };
                    }
                    if (response.status != 308)
                    {
                        throw remote_failure("Upload finalize", response);
                    }
                    commit(response, length);
                }
                throw UploadError(ErrorCode::StorageFailure, "Remote store did not complete the upload");
            }

            void abort() noexcept override
            {
                if (released_)
                {
                    return;
                }
                released_ = true;
                pending_.clear();
                store_.send_best_effort({.method = "DELETE", .url = session_uri_});
            }

        private:
            HttpResponse put_range(std::size_t length, bool last)
            {
                HttpRequest request{.method = "PUT", .url = session_uri_};
                request.body = pending_.substr(0, length);
                std::string content_range;
                if (length == 0)
                {
                    content_range = "bytes */" + std::to_string(total_size_);
                }
                else if (last)
                {
                    content_range = protocol::format_content_range({committed_, committed_ + length - 1, total_size_});
                }
                else
                {
                    content_range = "bytes " + std::to_string(committed_) + "-" +
                                    std::to_string(committed_ + length - 1) + "/*";
                }
                request.headers.set("Content-Range", std::move(content_range));
                return store_.send(std::move(request));
            }

            // Applies the Range header of a 308 response; bytes past it are sent again later.
            void commit(const HttpResponse &response, std::size_t sent)
            {
                std::uint64_t committed = 0;
                if (const auto range = response.headers.get("Range"))
                {
                    const auto parsed = protocol::parse_resume_range(*range);
                    if (!parsed)
                    {
                        throw UploadError(ErrorCode::StorageFailure, "Malformed Range from remote store: " + *range);
                    }
                    committed = *parsed;
                }
                if (committed > committed_ + sent)
                {
                    throw UploadError(ErrorCode::StorageFailure, "Remote store acknowledged more than was sent");
                }
                if (committed < committed_ || (committed == committed_ && sent > 0))
                {
                    throw UploadError(ErrorCode::StorageFailure, "Remote store made no progress at offset " +
                                                                     std::to_string(committed_));
                }
                pending_.erase(0, static_cast<std::size_t>(committed - committed_));
                committed_ = committed;
            }

            RemoteBlobStore &store_;
            std::string session_uri_;
            std::uint64_t total_size_;
            std::size_t chunk_size_;
            std::uint64_t committed_{};
            std::string pending_;
            bool released_{false};
        };

        class RemoteReadStream : public ByteStream
        {
        public:
            RemoteReadStream(RemoteBlobStore &store, std::string url, std::uint64_t size)
                : store_(store), url_(std::move(url)), size_(size), window_(store.config().granularity)
            {
                fill();
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                if (cursor_ == buffer_.size())
                {
                    if (exhausted_)
                    {
                        return 0;
                    }
                    fill();
                    if (buffer_.empty())
                    {
                        return 0;
                    }
                }
                const auto count = std::min(buffer.size(), buffer_.size() - cursor_);
                std::memcpy(buffer.data(), buffer_.data() + cursor_, count);
                cursor_ += count;
                return count;
            }

        private:
            void fill()
            {
                buffer_.clear();
                cursor_ = 0;
                HttpRequest request{.method = "GET", .url = url_};
                request.headers.set("Range", "bytes=" + std::to_string(position_) + "-" +
                                                 std::to_string(position_ + window_ - 1));
                auto response = store_.send(std::move(request));
                switch (response.status)
                {
                case 206:
                    buffer_ = std::move(response.body);
                    position_ += buffer_.size();
                    exhausted_ = buffer_.size() < window_ || (size_ > 0 && position_ >= size_);
                    break;
                case 200:
                    // Range ignored: the whole object arrived at once.
                    buffer_ = std::move(response.body);
                    position_ = buffer_.size();
                    exhausted_ = true;
                    break;
                case 416:
                    exhausted_ = true;
                    break;
                case 404:
                    throw UploadError(ErrorCode::NotFound, "Object not found");
                default:
                    throw remote_failure("Object download", response);
                }
            }

            RemoteBlobStore &store_;
            std::string url_;
            std::uint64_t size_;
            std::size_t window_;
            std::uint64_t position_{};
            std::string buffer_;
            std::size_t cursor_{};
            bool exhausted_{false};
        };

    } // namespace

    AccessTokenProvider::AccessTokenProvider(HttpTransport &transport, std::string token_url,
                                             RemoteCredentials credentials, RetryPolicy retry, ClockFunction clock)
        : transport_(transport), token_url_(std::move(token_url)), credentials_(std::move(credentials)),
          retry_(retry), clock_(clock ? std::move(clock) : ClockFunction([]
                                                                         { return std::chrono::system_clock::now(); })),
          cached_token_(credentials_.access_token)
    {
    }

    bool AccessTokenProvider::can_refresh() const noexcept
    {
        return !credentials_.refresh_token.empty() && !credentials_.client_id.empty();
    }

    std::string AccessTokenProvider::token()
    {
        std::lock_guard lock(mutex_);
        const bool expiring = expires_at_ && clock_() + kTokenRefreshMargin >= *expires_at_;
        if (!cached_token_.empty() && !expiring)
        {
            return cached_token_;
        }
        if (!can_refresh())
        {
            if (cached_token_.empty())
            {
                throw UploadError(ErrorCode::StorageFailure, "No remote credentials configured");
            }
            return cached_token_;
        }
        refresh_locked();
        return cached_token_;
    }

    void AccessTokenProvider::invalidate()
    {
        std::lock_guard lock(mutex_);
        if (can_refresh())
        {
            cached_token_.clear();
            expires_at_.reset();
        }
    }

    void AccessTokenProvider::refresh_locked()
    {
        HttpRequest request{.method = "POST", .url = token_url_};
        request.headers.set("Content-Type", "application/x-www-form-urlencoded");
        request.body = "client_id=" + url_encode(credentials_.client_id) +
                       "&client_secret=" + url_encode(credentials_.client_secret) +
                       "&refresh_token=" + url_encode(credentials_.refresh_token) + "&grant_type=refresh_token";

        HttpResponse response;
        try
        {
            response = perform_with_retry(transport_, request, retry_);
        }
        catch (const TransportError &ex)
        {
            throw UploadError(ErrorCode::StorageFailure, std::string("Token refresh failed: ") + ex.what());
        }
        if (response.status != 200)
        {
            throw remote_failure("Token refresh", response);
        }
        const auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.contains("access_token"))
        {
            throw UploadError(ErrorCode::StorageFailure, "Token endpoint returned no access token");
        }
        cached_token_ = body.at("access_token").get<std::string>();
        expires_at_ = clock_() + std::chrono::seconds(body.value("expires_in", 3600LL));
        spdlog::debug("Refreshed remote access token");
    }

    RemoteBlobStore::RemoteBlobStore(RemoteStoreConfig config, HttpTransport &transport,
                                     AccessTokenProvider::ClockFunction clock)
        : config_(std::move(config)), transport_(transport),
          tokens_(transport, config_.token_url, config_.credentials, config_.retry, std::move(clock))
    {
        if (config_.granularity == 0 || config_.upload_chunk_size == 0 ||
            config_.upload_chunk_size % config_.granularity != 0)
        {
            throw std::invalid_argument("Remote upload chunk size must be a positive multiple of the granularity");
        }
    }

    std::unique_ptr<BlobSink> RemoteBlobStore::open_sink(const ObjectMetadata &metadata)
    {
        nlohmann::json file = {
            {"name", metadata.filename.empty() ? std::string{"upload"} : metadata.filename},
            {"mimeType", metadata.content_type},
            {"appProperties", {{"ownerId", metadata.owner_id}}},
        };
        if (!config_.folder_id.empty())
        {
            file["parents"] = nlohmann::json::array({config_.folder_id});
        }

        HttpRequest request{.method = "POST", .url = config_.upload_url + "?uploadType=resumable"};
        request.headers.set("Content-Type", "application/json; charset=UTF-8");
        request.headers.set("X-Upload-Content-Type", metadata.content_type);
        request.headers.set("X-Upload-Content-Length", std::to_string(metadata.total_size));
        request.body = file.dump();

        auto response = send(std::move(request));
        if (response.status != 200 && response.status != 201)
        {
            throw remote_failure("Resumable upload init", response);
        }
        auto location = response.headers.get("Location");
        if (!location || location->empty())
        {
            throw UploadError(ErrorCode::StorageFailure, "Remote store returned no upload session URI");
        }
        spdlog::debug("Opened remote upload session for '{}'", metadata.filename);
        return std::make_unique<RemoteBlobSink>(*this, std::move(*location), metadata.total_size);
    }

    std::unique_ptr<ByteStream> RemoteBlobStore::open_read_stream(const ObjectHandle &handle)
    {
        return std::make_unique<RemoteReadStream>(*this, media_url(handle), handle.size);
    }

    void RemoteBlobStore::remove(const ObjectHandle &handle)
    {
        if (handle.provider != kProvider || !is_remote_id(handle.id))
        {
            throw UploadError(ErrorCode::NotFound, "Object not found");
        }
        auto response = send({.method = "DELETE", .url = config_.files_url + "/" + handle.id});
        if (response.status == 404)
        {
            throw UploadError(ErrorCode::NotFound, "Object not found");
        }
        if (response.status != 200 && response.status != 204)
        {
            throw remote_failure("Object delete", response);
        }
    }

    HttpResponse RemoteBlobStore::send(HttpRequest request)
    {
        try
        {
            request.headers.set("Authorization", "Bearer " + tokens_.token());
            auto response = perform_with_retry(transport_, request, config_.retry);
            if (response.status == 401 && tokens_.can_refresh())
            {
                tokens_.invalidate();
                request.headers.set("Authorization", "Bearer " + tokens_.token());
                response = perform_with_retry(transport_, request, config_.retry);
            }
            return response;
        }
        catch (const TransportError &ex)
        {
            throw UploadError(ErrorCode::StorageFailure, ex.what());
        }
    }

    void RemoteBlobStore::send_best_effort(HttpRequest request) noexcept
    {
        try
        {
            request.headers.set("Authorization", "Bearer " + tokens_.token());
            const auto response = transport_.perform(request);
            if (response.status >= 400 && response.status != 404 && response.status != 499)
            {
                spdlog::warn("{} {} returned {}", request.method, request.url, response.status);
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("{} {} failed: {}", request.method, request.url, ex.what());
        }
    }

    std::string RemoteBlobStore::media_url(const ObjectHandle &handle) const
    {
        if (handle.provider != kProvider || !is_remote_id(handle.id))
        {
            throw UploadError(ErrorCode::NotFound, "Object not found");
        }
        return config_.files_url + "/" + handle.id + "?alt=media";
    }

} // namespace chunkvault::server
