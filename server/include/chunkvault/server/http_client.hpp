#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

#include "chunkvault/http_message.hpp"

namespace chunkvault::server
{

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        http::Headers headers;
        std::string body;
    };

    struct HttpResponse
    {
        int status{};
        http::Headers headers;
        std::string body;
    };

    // Connection-level failure: no HTTP status was received.
    class TransportError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct RetryPolicy
    {
        int max_retries{3};
        std::chrono::milliseconds initial_delay{1000};
        double backoff_multiplier{2.0};
    };

    bool is_retryable_status(int status) noexcept;

    // Percent-encodes everything outside the unreserved set, for query strings and form bodies.
    std::string url_encode(std::string_view value);

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        // Throws TransportError when no response was received.
        virtual HttpResponse perform(const HttpRequest &request) = 0;
    };

    struct CurlTransportOptions
    {
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds request_timeout{120000};
        std::string user_agent{"chunkvault"};
    };

    class CurlTransport : public HttpTransport
    {
    public:
        explicit CurlTransport(CurlTransportOptions options = {});

        HttpResponse perform(const HttpRequest &request) override;

    private:
        CurlTransportOptions options_;
    };

    // Retries transport errors, 429 and 5xx with exponential backoff. The last response or
    // transport error is surfaced once the retries are exhausted.
    HttpResponse perform_with_retry(HttpTransport &transport, const HttpRequest &request,
                                    const RetryPolicy &policy = {});

} // namespace chunkvault::server
