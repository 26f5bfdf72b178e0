#include "chunkvault/error_codes.hpp"

#include <array>

namespace chunkvault
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            int http_status;
        };

        constexpr std::array<ErrorCodeDescription, 17> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidPayload, "invalid_payload", 400},
            {ErrorCode::MalformedRange, "malformed_range", 400},
            {ErrorCode::RangeExceedsTotal, "range_exceeds_total", 416},
            {ErrorCode::TotalMismatch, "total_mismatch", 400},
            {ErrorCode::OutOfOrderChunk, "out_of_order_chunk", 409},
            {ErrorCode::InvalidContentLength, "invalid_content_length", 411},
            {ErrorCode::InvalidSize, "invalid_size", 400},
            {ErrorCode::IncompleteChunk, "incomplete_chunk", 400},
            {ErrorCode::Unauthorized, "unauthorized", 401},
            {ErrorCode::Forbidden, "forbidden", 403},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::Conflict, "conflict", 409},
            {ErrorCode::SinkClosed, "sink_closed", 410},
            {ErrorCode::StorageFailure, "storage_failure", 502},
            {ErrorCode::Unsupported, "unsupported", 501},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    ErrorCode error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    int http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.http_status;
            }
        }
        return 500;
    }

    UploadError::UploadError(ErrorCode code, std::string message, std::optional<std::uint64_t> received_size)
        : std::runtime_error(std::move(message)), code_(code), received_size_(received_size)
    {
    }

} // namespace chunkvault
