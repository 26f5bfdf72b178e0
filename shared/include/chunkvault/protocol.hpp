/**
 * chunkvault - JSON payloads exchanged over the upload HTTP API.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    enum class UploadStatus : std::uint8_t
    {
        Pending,
        Uploading,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept;

    bool is_terminal(UploadStatus status) noexcept;

    struct ObjectHandle
    {
        std::string provider;
        std::string id;
        std::uint64_t size{};

        bool operator==(const ObjectHandle &) const = default;
    };

    void to_json(nlohmann::json &json, const ObjectHandle &handle);
    void from_json(const nlohmann::json &json, ObjectHandle &handle);

    struct UploadInitRequest
    {
        std::string filename;
        std::string content_type{"application/octet-stream"};
        std::uint64_t total_size{};
        std::optional<std::string> provider{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string session_id;
        std::uint64_t total_size{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct ChunkResult
    {
        bool complete{};
        std::uint64_t received_size{};
        std::optional<ObjectHandle> object{};
    };

    void to_json(nlohmann::json &json, const ChunkResult &result);
    void from_json(const nlohmann::json &json, ChunkResult &result);

    struct UploadProgress
    {
        std::string session_id;
        UploadStatus status{UploadStatus::Pending};
        std::uint64_t received_size{};
        std::uint64_t total_size{};
    };

    void to_json(nlohmann::json &json, const UploadProgress &progress);
    void from_json(const nlohmann::json &json, UploadProgress &progress);

    struct ErrorBody
    {
        ErrorCode error{ErrorCode::InternalError};
        std::string message;
        std::optional<std::uint64_t> received_size{};
    };

    void to_json(nlohmann::json &json, const ErrorBody &body);
    void from_json(const nlohmann::json &json, ErrorBody &body);

} // namespace chunkvault::protocol
