#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/http_client.hpp"

namespace chunkvault::server
{

    struct RemoteCredentials
    {
        std::string access_token;
        std::string client_id;
        std::string client_secret;
        std::string refresh_token;
    };

    struct RemoteStoreConfig
    {
        std::string upload_url{"https://www.googleapis.com/upload/drive/v3/files"};
        std::string files_url{"https://www.googleapis.com/drive/v3/files"};
        std::string token_url{"https://oauth2.googleapis.com/token"};
        std::string folder_id;
        RemoteCredentials credentials;
        RetryPolicy retry{};
        // Chunk uploads and ranged downloads are sized in multiples of this.
        std::size_t granularity{256 * 1024};
        std::size_t upload_chunk_size{1024 * 1024};
    };

    // OAuth2 bearer tokens: a fixed token, or refresh-token exchange cached until shortly before expiry.
    class AccessTokenProvider
    {
    public:
        using ClockFunction = std::function<std::chrono::system_clock::time_point()>;

        AccessTokenProvider(HttpTransport &transport, std::string token_url, RemoteCredentials credentials,
                            RetryPolicy retry = {}, ClockFunction clock = {});

        std::string token();

        // Drops the cached token after the remote rejected it.
        void invalidate();

        bool can_refresh() const noexcept;

    private:
        void refresh_locked();

        HttpTransport &transport_;
        std::string token_url_;
        RemoteCredentials credentials_;
        RetryPolicy retry_;
        ClockFunction clock_;

        std::mutex mutex_;
        std::string cached_token_;
        std::optional<std::chrono::system_clock::time_point> expires_at_;
    };

    // Resumable-upload API in the style of Google Drive v3.
    class RemoteBlobStore : public BlobStore
    {
    public:
        static constexpr std::string_view kProvider = "remote";

        RemoteBlobStore(RemoteStoreConfig config, HttpTransport &transport,
                        AccessTokenProvider::ClockFunction clock = {});

        std::string_view provider() const noexcept override { return kProvider; }

        std::unique_ptr<BlobSink> open_sink(const ObjectMetadata &metadata) override;

        std::unique_ptr<ByteStream> open_read_stream(const ObjectHandle &handle) override;

        void remove(const ObjectHandle &handle) override;

        const RemoteStoreConfig &config() const noexcept { return config_; }

        // Sends request with a bearer token and the retry policy; a 401 triggers one token refresh.
        HttpResponse send(HttpRequest request);

        // Single attempt, failures only logged.
        void send_best_effort(HttpRequest request) noexcept;

    private:
        std::string media_url(const ObjectHandle &handle) const;

        RemoteStoreConfig config_;
        HttpTransport &transport_;
        AccessTokenProvider tokens_;
    };

} // namespace chunkvault::server
