#pragma once

#include <cstdint>
#include <string>

#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>
#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"
#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/http_session.hpp"

namespace chunkvault::server
{

    // Request body of known length: bytes already buffered with the head first, then the socket.
    class RequestBody : public ByteStream
    {
    public:
        RequestBody(asio::ip::tcp::socket &socket, asio::streambuf &buffer, std::uint64_t length);

        std::size_t read(std::span<std::byte> out) override;

        // Reads the whole body as text. Throws UploadError(InvalidPayload) above limit.
        std::string read_all(std::size_t limit);

        std::uint64_t remaining() const noexcept { return remaining_; }

    private:
        asio::ip::tcp::socket &socket_;
        asio::streambuf &buffer_;
        std::uint64_t remaining_;
    };

} // namespace chunkvault::server

namespace chunkvault::server::http_session_common
{

    constexpr std::size_t kMaxJsonBody = 64 * 1024;
    constexpr std::string_view kOwnerHeader = "X-Owner-Id";

    HttpReply json_reply(int status, const nlohmann::json &body);

    HttpReply empty_reply(int status);

    HttpReply error_reply(const UploadError &error);

    HttpReply error_reply(ErrorCode code, const std::string &message);

    // 308 carrying the Range header for received_size and a progress body.
    HttpReply resume_reply(std::uint64_t received_size);

} // namespace chunkvault::server::http_session_common
