/**
 * chunkvault - Error codes shared by the engine, the HTTP boundary and the client.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chunkvault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidPayload = 1,
        MalformedRange = 2,
        RangeExceedsTotal = 3,
        TotalMismatch = 4,
        OutOfOrderChunk = 5,
        InvalidContentLength = 6,
        InvalidSize = 7,
        IncompleteChunk = 8,
        Unauthorized = 9,
        Forbidden = 10,
        NotFound = 11,
        Conflict = 12,
        SinkClosed = 13,
        StorageFailure = 14,
        Unsupported = 15,
        InternalError = 16
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    ErrorCode error_code_from_string(std::string_view value) noexcept;

    // HTTP status used by the boundary when reporting this code.
    int http_status(ErrorCode code) noexcept;

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(ErrorCode code, std::string message, std::optional<std::uint64_t> received_size = std::nullopt);

        ErrorCode code() const noexcept { return code_; }

        // Bytes accepted so far, when the failing operation knows it.
        std::optional<std::uint64_t> received_size() const noexcept { return received_size_; }

    private:
        ErrorCode code_;
        std::optional<std::uint64_t> received_size_;
    };

} // namespace chunkvault
