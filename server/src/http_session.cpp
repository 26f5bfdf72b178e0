#include "chunkvault/server/http_session.hpp"

#include <asio/buffers_iterator.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <spdlog/spdlog.h>

#include "chunkvault/error_codes.hpp"
#include "http_session_common.hpp"

namespace chunkvault::server
{

    using namespace http_session_common;

    HttpSession::HttpSession(asio::ip::tcp::socket socket, HttpServices services)
        : socket_(std::move(socket)), services_(services), buffer_(http::kMaxHeadSize)
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        peer_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    HttpSession::~HttpSession()
    {
        spdlog::debug("Connection from {} closed", peer_);
    }

    void HttpSession::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_head();
    }

    void HttpSession::stop()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void HttpSession::read_head()
    {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, std::string(http::kHeadTerminator),
                               [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                               { on_head(ec, bytes_transferred); });
    }

    void HttpSession::on_head(const std::error_code &ec, std::size_t bytes_transferred)
    {
        if (ec)
        {
            if (ec == asio::error::not_found)
            {
                // Head larger than kMaxHeadSize.
                response_started_ = false;
                try
                {
                    write_reply(error_reply(ErrorCode::InvalidPayload, "Request head too large"), true);
                }
                catch (const std::exception &ex)
                {
                    spdlog::debug("{}: {}", remote_endpoint(), ex.what());
                }
            }
            else if (ec != asio::error::eof && ec != asio::error::operation_aborted)
            {
                spdlog::debug("{}: read failed: {}", remote_endpoint(), ec.message());
            }
            stop();
            return;
        }

        const auto data = buffer_.data();
        const std::string head_text(asio::buffers_begin(data),
                                    asio::buffers_begin(data) +
                                        static_cast<std::ptrdiff_t>(bytes_transferred - http::kHeadTerminator.size()));
        buffer_.consume(bytes_transferred);
        response_started_ = false;

        bool keep_alive = false;
        try
        {
            const auto request = http::parse_request_head(head_text);
            keep_alive = handle_request(request, !http::wants_close(request.version, request.headers));
        }
        catch (const UploadError &ex)
        {
            if (!response_started_)
            {
                try
                {
                    write_reply(error_reply(ex), true);
                }
                catch (const std::exception &write_error)
                {
                    spdlog::debug("{}: {}", remote_endpoint(), write_error.what());
                }
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("{}: connection error: {}", remote_endpoint(), ex.what());
        }

        if (keep_alive)
        {
            read_head();
        }
        else
        {
            stop();
        }
    }

    bool HttpSession::handle_request(const http::RequestHead &request, bool keep_alive)
    {
        if (http::is_chunked(request.headers))
        {
            write_reply(error_reply(ErrorCode::InvalidContentLength, "Chunked request bodies are not supported"), true);
            return false;
        }
        const auto length = http::content_length(request.headers);
        RequestBody body(socket_, buffer_, length.value_or(0));

        std::optional<HttpReply> reply;
        try
        {
            reply = dispatch(request, body);
        }
        catch (const UploadError &ex)
        {
            if (response_started_)
            {
                spdlog::warn("{} {} aborted mid-response: {}", request.method, request.target, ex.what());
                return false;
            }
            if (ex.code() == ErrorCode::StorageFailure || ex.code() == ErrorCode::InternalError)
            {
                spdlog::error("{} {}: {}", request.method, request.target, ex.what());
            }
            reply = error_reply(ex);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} {} failed: {}", request.method, request.target, ex.what());
            if (response_started_)
            {
                return false;
            }
            reply = error_reply(ErrorCode::InternalError, ex.what());
        }

        // Unread body bytes would be taken for the next request head.
        const bool reusable = keep_alive && body.remaining() == 0;
        if (reply)
        {
            spdlog::debug("{} {} {} -> {}", remote_endpoint(), request.method, request.target, reply->status);
            write_reply(std::move(*reply), !reusable);
        }
        return reusable;
    }

    std::optional<HttpReply> HttpSession::dispatch(const http::RequestHead &request, RequestBody &body)
    {
        const auto owner = request.headers.get(kOwnerHeader);
        if (!owner || owner->empty())
        {
            throw UploadError(ErrorCode::Unauthorized, "Missing X-Owner-Id header");
        }

        const auto segments = http::split_path(request.target);
        const auto &method = request.method;
        if (!segments.empty() && segments[0] == "uploads")
        {
            if (segments.size() == 1 && method == "POST")
            {
                return handle_create_upload(*owner, request, body);
            }
            if (segments.size() == 2)
            {
                if (method == "PUT")
                {
                    return handle_put_chunk(*owner, segments[1], request, body);
                }
                if (method == "GET")
                {
                    return handle_get_upload(*owner, segments[1]);
                }
                if (method == "DELETE")
                {
                    return handle_cancel_upload(*owner, segments[1]);
                }
            }
        }
        else if (segments.size() == 3 && segments[0] == "objects")
        {
            if (method == "GET")
            {
                handle_download(segments[1], segments[2]);
                return std::nullopt;
            }
            if (method == "DELETE")
            {
                return handle_delete_object(segments[1], segments[2]);
            }
        }
        throw UploadError(ErrorCode::NotFound, "No route for " + method + " " + request.target);
    }

    void HttpSession::write_reply(HttpReply reply, bool close)
    {
        http::ResponseHead head{.status = reply.status, .headers = std::move(reply.headers)};
        head.headers.set("Content-Length", std::to_string(reply.body.size()));
        if (close)
        {
            head.headers.set("Connection", "close");
        }
        auto message = http::serialize(head);
        message += reply.body;
        write_raw(message);
    }

    void HttpSession::write_raw(std::string_view data)
    {
        response_started_ = true;
        asio::write(socket_, asio::buffer(data.data(), data.size()));
    }

    std::string HttpSession::remote_endpoint() const
    {
        return peer_;
    }

} // namespace chunkvault::server
