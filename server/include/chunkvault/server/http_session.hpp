#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

#include "chunkvault/http_message.hpp"
#include "chunkvault/server/upload_engine.hpp"

namespace chunkvault::server
{

    class RequestBody;

    struct HttpServices
    {
        UploadEngine &engine;
    };

    struct HttpReply
    {
        int status{200};
        http::Headers headers;
        std::string body;
    };

    // One client connection. Heads are read asynchronously; each request is then handled on the
    // worker that read it, reading the body with blocking socket reads.
    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        HttpSession(asio::ip::tcp::socket socket, HttpServices services);
        ~HttpSession();

        void start();

        void stop();

    private:
        void read_head();
        void on_head(const std::error_code &ec, std::size_t bytes_transferred);

        // Returns whether the connection can carry another request.
        bool handle_request(const http::RequestHead &request, bool keep_alive);
        std::optional<HttpReply> dispatch(const http::RequestHead &request, RequestBody &body);

        // Route handlers
        HttpReply handle_create_upload(const std::string &owner_id, const http::RequestHead &request,
                                       RequestBody &body);
        HttpReply handle_put_chunk(const std::string &owner_id, const std::string &session_id,
                                   const http::RequestHead &request, RequestBody &body);
        HttpReply handle_get_upload(const std::string &owner_id, const std::string &session_id);
        HttpReply handle_cancel_upload(const std::string &owner_id, const std::string &session_id);
        void handle_download(const std::string &provider, const std::string &object_id);
        HttpReply handle_delete_object(const std::string &provider, const std::string &object_id);

        void write_reply(HttpReply reply, bool close);
        void write_raw(std::string_view data);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        HttpServices services_;
        asio::streambuf buffer_;
        bool response_started_{false};
        std::string peer_;
    };

} // namespace chunkvault::server
