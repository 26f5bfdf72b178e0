#include "chunkvault/server/http_session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkvault/content_range.hpp"
#include "chunkvault/protocol.hpp"
#include "http_session_common.hpp"

namespace chunkvault::server
{

    using namespace http_session_common;

    HttpReply HttpSession::handle_create_upload(const std::string &owner_id, const http::RequestHead &request,
                                                RequestBody &body)
    {
        if (!http::content_length(request.headers))
        {
            throw UploadError(ErrorCode::InvalidContentLength, "Upload init requires a Content-Length");
        }

        protocol::UploadInitRequest init;
        try
        {
            init = nlohmann::json::parse(body.read_all(kMaxJsonBody)).get<protocol::UploadInitRequest>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw UploadError(ErrorCode::InvalidPayload, ex.what());
        }

        ObjectMetadata metadata{
            .filename = init.filename,
            .content_type = init.content_type,
            .total_size = init.total_size,
            .owner_id = owner_id,
            .provider = init.provider,
        };
        const auto session_id = services_.engine.init_upload(owner_id, init.total_size, std::move(metadata));

        auto reply = json_reply(201, protocol::UploadInitResponse{.session_id = session_id, .total_size = init.total_size});
        reply.headers.set("Location", "/uploads/" + session_id);
        return reply;
    }

    HttpReply HttpSession::handle_put_chunk(const std::string &owner_id, const std::string &session_id,
                                            const http::RequestHead &request, RequestBody &body)
    {
        const auto range = request.headers.get("Content-Range");
        if (!range)
        {
            throw UploadError(ErrorCode::MalformedRange, "Content-Range header is required");
        }

        if (const auto total = protocol::parse_status_query(*range))
        {
            const auto progress = services_.engine.query_upload(session_id, owner_id);
            if (*total != progress.total_size)
            {
                throw UploadError(ErrorCode::TotalMismatch, "Range total does not match declared size");
            }
            return resume_reply(progress.received_size);
        }

        const auto declared_length = http::content_length(request.headers);
        if (!declared_length)
        {
            throw UploadError(ErrorCode::InvalidContentLength, "Chunk upload requires a Content-Length");
        }

        const auto result = services_.engine.append_chunk(session_id, owner_id, *range, body, declared_length);
        if (!result.complete)
        {
            return resume_reply(result.received_size);
        }
        return json_reply(200, result);
    }

    HttpReply HttpSession::handle_get_upload(const std::string &owner_id, const std::string &session_id)
    {
        return json_reply(200, services_.engine.query_upload(session_id, owner_id));
    }

    HttpReply HttpSession::handle_cancel_upload(const std::string &owner_id, const std::string &session_id)
    {
        services_.engine.cancel_upload(session_id, owner_id);
        return empty_reply(204);
    }

} // namespace chunkvault::server
