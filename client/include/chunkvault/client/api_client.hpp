#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "chunkvault/http_message.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    struct ApiResponse
    {
        int status{};
        http::Headers headers;
        std::string body;

        // The JSON error body of a failed request, when the server sent one.
        std::optional<protocol::ErrorBody> error() const;
    };

    // Blocking HTTP/1.1 connection to the upload server, reconnecting when the server closes it.
    class ApiClient
    {
    public:
        using BodySink = std::function<void(std::span<const std::byte>)>;

        ApiClient(std::string host, std::uint16_t port, std::string owner_id);

        ApiResponse send(const std::string &method, const std::string &target, http::Headers headers = {},
                         std::string_view body = {});

        // Streams the response body of a GET into sink, chunked or not; the returned body stays empty.
        ApiResponse fetch(const std::string &target, const BodySink &sink);

        void close();

        std::string endpoint() const;

    private:
        void ensure_connected();
        void write_request(const std::string &method, const std::string &target, http::Headers headers,
                           std::string_view body);
        http::ResponseHead read_head();
        void read_body(const http::ResponseHead &head, const BodySink &sink);
        void fill_buffer();
        void finish_response(const http::ResponseHead &head);

        std::string host_;
        std::uint16_t port_;
        std::string owner_id_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        asio::streambuf buffer_;
    };

} // namespace chunkvault::client
