#include "chunkvault/protocol.hpp"

#include <array>
#include <stdexcept>

namespace chunkvault::protocol
{

    namespace
    {

        struct StatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 5> kStatusMappings{{
            {UploadStatus::Pending, "pending"},
            {UploadStatus::Uploading, "uploading"},
            {UploadStatus::Completed, "completed"},
            {UploadStatus::Failed, "failed"},
            {UploadStatus::Cancelled, "cancelled"},
        }};

    } // namespace

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    bool is_terminal(UploadStatus status) noexcept
    {
        return status == UploadStatus::Completed || status == UploadStatus::Failed ||
               status == UploadStatus::Cancelled;
    }

    void to_json(nlohmann::json &json, const ObjectHandle &handle)
    {
        json = {
            {"provider", handle.provider},
            {"id", handle.id},
            {"size", handle.size},
        };
    }

    void from_json(const nlohmann::json &json, ObjectHandle &handle)
    {
        handle.provider = json.at("provider").get<std::string>();
        handle.id = json.at("id").get<std::string>();
        handle.size = json.value("size", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"content_type", request.content_type},
            {"total_size", request.total_size},
        };
        if (request.provider)
        {
            json["provider"] = *request.provider;
        }
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.filename = json.value("filename", std::string{});
        request.content_type = json.value("content_type", std::string{"application/octet-stream"});
        request.total_size = json.at("total_size").get<std::uint64_t>();
        if (json.contains("provider") && !json.at("provider").is_null())
        {
            request.provider = json.at("provider").get<std::string>();
        }
        else
        {
            request.provider.reset();
        }
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"session_id", response.session_id},
            {"total_size", response.total_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.session_id = json.at("session_id").get<std::string>();
        response.total_size = json.value("total_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const ChunkResult &result)
    {
        json = {
            {"complete", result.complete},
            {"received_size", result.received_size},
        };
        if (result.object)
        {
            json["object"] = *result.object;
        }
    }

    void from_json(const nlohmann::json &json, ChunkResult &result)
    {
        result.complete = json.value("complete", false);
        result.received_size = json.value("received_size", 0ULL);
        if (json.contains("object") && json.at("object").is_object())
        {
            result.object = json.at("object").get<ObjectHandle>();
        }
        else
        {
            result.object.reset();
        }
    }

    void to_json(nlohmann::json &json, const UploadProgress &progress)
    {
        json = {
            {"session_id", progress.session_id},
            {"status", to_string(progress.status)},
            {"received_size", progress.received_size},
            {"total_size", progress.total_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadProgress &progress)
    {
        progress.session_id = json.value("session_id", std::string{});
        const auto status = upload_status_from_string(json.at("status").get<std::string>());
        if (!status)
        {
            throw std::invalid_argument("Unknown upload status");
        }
        progress.status = *status;
        progress.received_size = json.value("received_size", 0ULL);
        progress.total_size = json.value("total_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const ErrorBody &body)
    {
        json = {
            {"error", to_string(body.error)},
            {"message", body.message},
        };
        if (body.received_size)
        {
            json["received_size"] = *body.received_size;
        }
    }

    void from_json(const nlohmann::json &json, ErrorBody &body)
    {
        body.error = error_code_from_string(json.value("error", std::string{}));
        body.message = json.value("message", std::string{});
        if (json.contains("received_size"))
        {
            body.received_size = json.at("received_size").get<std::uint64_t>();
        }
        else
        {
            body.received_size.reset();
        }
    }

} // namespace chunkvault::protocol
