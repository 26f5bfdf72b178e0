#include "http_session_common.hpp"

#include <algorithm>
#include <cstring>
#include <system_error>

#include <asio/buffer.hpp>
#include <asio/error.hpp>

#include "chunkvault/content_range.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::server
{

    RequestBody::RequestBody(asio::ip::tcp::socket &socket, asio::streambuf &buffer, std::uint64_t length)
        : socket_(socket), buffer_(buffer), remaining_(length)
    {
    }

    std::size_t RequestBody::read(std::span<std::byte> out)
    {
        if (remaining_ == 0 || out.empty())
        {
            return 0;
        }
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(out.size(), remaining_));

        if (buffer_.size() > 0)
        {
            const auto count = std::min(want, buffer_.size());
            asio::buffer_copy(asio::buffer(out.data(), count), buffer_.data());
            buffer_.consume(count);
            remaining_ -= count;
            return count;
        }

        std::error_code ec;
        const auto count = socket_.read_some(asio::buffer(out.data(), want), ec);
        if (ec == asio::error::eof)
        {
            return 0;
        }
        if (ec)
        {
            throw std::system_error(ec);
        }
        remaining_ -= count;
        return count;
    }

    std::string RequestBody::read_all(std::size_t limit)
    {
        if (remaining_ > limit)
        {
            throw UploadError(ErrorCode::InvalidPayload, "Request body too large");
        }
        std::string text(static_cast<std::size_t>(remaining_), '\0');
        std::size_t filled = 0;
        while (filled < text.size())
        {
            const auto count = read(std::as_writable_bytes(std::span(text)).subspan(filled));
            if (count == 0)
            {
                throw UploadError(ErrorCode::InvalidPayload, "Request body ended early");
            }
            filled += count;
        }
        return text;
    }

} // namespace chunkvault::server

namespace chunkvault::server::http_session_common
{

    HttpReply json_reply(int status, const nlohmann::json &body)
    {
        HttpReply reply{.status = status};
        reply.headers.set("Content-Type", "application/json");
        reply.body = body.dump();
        return reply;
    }

    HttpReply empty_reply(int status)
    {
        return HttpReply{.status = status};
    }

    HttpReply error_reply(const UploadError &error)
    {
        protocol::ErrorBody body{
            .error = error.code(),
            .message = error.what(),
            .received_size = error.received_size(),
        };
        auto reply = json_reply(http_status(error.code()), body);
        if (error.received_size())
        {
            if (auto range = protocol::format_resume_range(*error.received_size()))
            {
                reply.headers.set("Range", std::move(*range));
            }
        }
        return reply;
    }

    HttpReply error_reply(ErrorCode code, const std::string &message)
    {
        return error_reply(UploadError(code, message));
    }

    HttpReply resume_reply(std::uint64_t received_size)
    {
        auto reply = json_reply(308, protocol::ChunkResult{.complete = false, .received_size = received_size});
        if (auto range = protocol::format_resume_range(received_size))
        {
            reply.headers.set("Range", std::move(*range));
        }
        return reply;
    }

} // namespace chunkvault::server::http_session_common
