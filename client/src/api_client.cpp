#include "chunkvault/client/api_client.hpp"

#include <asio/buffers_iterator.hpp>
#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkvault::client
{

    namespace
    {
        constexpr std::string_view kOwnerHeader = "X-Owner-Id";
    } // namespace

    std::optional<protocol::ErrorBody> ApiResponse::error() const
    {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded() || !json.is_object() || !json.contains("error"))
        {
            return std::nullopt;
        }
        try
        {
            return json.get<protocol::ErrorBody>();
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
    }

    ApiClient::ApiClient(std::string host, std::uint16_t port, std::string owner_id)
        : host_(std::move(host)), port_(port), owner_id_(std::move(owner_id)), socket_(io_context_)
    {
    }

    ApiResponse ApiClient::send(const std::string &method, const std::string &target, http::Headers headers,
                                std::string_view body)
    {
        ensure_connected();
        write_request(method, target, std::move(headers), body);
        const auto head = read_head();

        ApiResponse response{.status = head.status, .headers = head.headers};
        if (method != "HEAD")
        {
            read_body(head, [&](std::span<const std::byte> data)
                      { response.body.append(reinterpret_cast<const char *>(data.data()), data.size()); });
        }
        finish_response(head);
        return response;
    }

    ApiResponse ApiClient::fetch(const std::string &target, const BodySink &sink)
    {
        ensure_connected();
        write_request("GET", target, {}, {});
        const auto head = read_head();

        ApiResponse response{.status = head.status, .headers = head.headers};
        if (head.status == 200)
        {
            read_body(head, sink);
        }
        else
        {
            read_body(head, [&](std::span<const std::byte> data)
                      { response.body.append(reinterpret_cast<const char *>(data.data()), data.size()); });
        }
        finish_response(head);
        return response;
    }

    void ApiClient::close()
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        buffer_.consume(buffer_.size());
    }

    std::string ApiClient::endpoint() const
    {
        return host_ + ":" + std::to_string(port_);
    }

    void ApiClient::ensure_connected()
    {
        if (socket_.is_open())
        {
            return;
        }
        buffer_.consume(buffer_.size());
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host_, std::to_string(port_));
        asio::connect(socket_, results);
    }

    void ApiClient::write_request(const std::string &method, const std::string &target, http::Headers headers,
                                  std::string_view body)
    {
        http::RequestHead head{.method = method, .target = target, .headers = std::move(headers)};
        head.headers.set("Host", endpoint());
        head.headers.set(std::string(kOwnerHeader), owner_id_);
        if (!body.empty() || method == "POST" || method == "PUT")
        {
            head.headers.set("Content-Length", std::to_string(body.size()));
        }
        const auto text = http::serialize(head);
        std::array<asio::const_buffer, 2> buffers{asio::buffer(text), asio::buffer(body.data(), body.size())};
        try
        {
            asio::write(socket_, buffers);
        }
        catch (const std::system_error &)
        {
            close();
            throw;
        }
    }

    http::ResponseHead ApiClient::read_head()
    {
        std::error_code ec;
        const auto bytes = asio::read_until(socket_, buffer_, std::string(http::kHeadTerminator), ec);
        if (ec)
        {
            close();
            throw std::system_error(ec, "Reading response from " + endpoint());
        }
        const auto data = buffer_.data();
        const std::string text(asio::buffers_begin(data),
                               asio::buffers_begin(data) +
                                   static_cast<std::ptrdiff_t>(bytes - http::kHeadTerminator.size()));
        buffer_.consume(bytes);
        return http::parse_response_head(text);
    }

    void ApiClient::read_body(const http::ResponseHead &head, const BodySink &sink)
    {
        if (head.status == 204 || head.status == 304 || (head.status >= 100 && head.status < 200))
        {
            return;
        }

        if (http::is_chunked(head.headers))
        {
            http::ChunkedDecoder decoder;
            std::vector<std::byte> decoded;
            while (!decoder.done())
            {
                if (buffer_.size() == 0)
                {
                    fill_buffer();
                }
                const auto data = buffer_.data();
                const std::string pending(asio::buffers_begin(data), asio::buffers_end(data));
                decoded.clear();
                const auto consumed = decoder.feed(pending, decoded);
                buffer_.consume(consumed);
                if (!decoded.empty())
                {
                    sink(decoded);
                }
                if (consumed == 0 && !decoder.done())
                {
                    fill_buffer();
                }
            }
            return;
        }

        if (const auto length = http::content_length(head.headers))
        {
            std::uint64_t remaining = *length;
            std::vector<std::byte> chunk;
            while (remaining > 0)
            {
                if (buffer_.size() == 0)
                {
                    fill_buffer();
                }
                const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer_.size()));
                chunk.resize(count);
                asio::buffer_copy(asio::buffer(chunk), buffer_.data(), count);
                buffer_.consume(count);
                remaining -= count;
                sink(chunk);
            }
            return;
        }

        // Neither length nor chunked: the body runs until the server closes.
        std::error_code ec;
        while (!ec)
        {
            asio::read(socket_, buffer_, asio::transfer_at_least(1), ec);
            std::vector<std::byte> chunk(buffer_.size());
            asio::buffer_copy(asio::buffer(chunk), buffer_.data());
            buffer_.consume(chunk.size());
            if (!chunk.empty())
            {
                sink(chunk);
            }
        }
        close();
    }

    void ApiClient::fill_buffer()
    {
        std::error_code ec;
        asio::read(socket_, buffer_, asio::transfer_at_least(1), ec);
        if (ec)
        {
            close();
            throw std::system_error(ec, "Connection to " + endpoint() + " lost");
        }
    }

    void ApiClient::finish_response(const http::ResponseHead &head)
    {
        if (http::wants_close(head.version, head.headers))
        {
            close();
        }
    }

} // namespace chunkvault::client
