#include "chunkvault/server/http_session.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "http_session_common.hpp"

namespace chunkvault::server
{

    using namespace http_session_common;

    namespace
    {
        constexpr std::size_t kDownloadBufferSize = 64 * 1024;
    } // namespace

    void HttpSession::handle_download(const std::string &provider, const std::string &object_id)
    {
        auto stream = services_.engine.open_download({.provider = provider, .id = object_id});

        http::ResponseHead head{.status = 200};
        head.headers.set("Content-Type", "application/octet-stream");
        head.headers.set("Transfer-Encoding", "chunked");
        write_raw(http::serialize(head));

        std::vector<std::byte> buffer(kDownloadBufferSize);
        std::uint64_t sent = 0;
        while (true)
        {
            const auto count = stream->read(buffer);
            if (count == 0)
            {
                break;
            }
            write_raw(http::encode_chunk(std::span<const std::byte>(buffer).first(count)));
            sent += count;
        }
        write_raw(http::last_chunk());
        spdlog::debug("{}: sent {}/{} ({} bytes)", remote_endpoint(), provider, object_id, sent);
    }

    HttpReply HttpSession::handle_delete_object(const std::string &provider, const std::string &object_id)
    {
        services_.engine.delete_object({.provider = provider, .id = object_id});
        return empty_reply(204);
    }

} // namespace chunkvault::server
