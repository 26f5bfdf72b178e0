/**
 * chunkvault - Content-Range parsing for the chunked upload protocol.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkvault::protocol
{

    struct ChunkRange
    {
        std::uint64_t start{};
        std::uint64_t end{};
        std::uint64_t total{};

        std::uint64_t length() const noexcept { return end - start + 1; }

        bool operator==(const ChunkRange &) const = default;
    };

    // Parses "bytes {start}-{end}/{total}". Throws UploadError with MalformedRange or RangeExceedsTotal.
    ChunkRange parse_content_range(std::string_view header);

    // Parses the status query form "bytes */{total}" and returns the total, or nullopt for any other form.
    std::optional<std::uint64_t> parse_status_query(std::string_view header) noexcept;

    std::string format_content_range(const ChunkRange &range);

    // Value of the Range header on a resume response; nullopt when nothing was received yet.
    std::optional<std::string> format_resume_range(std::uint64_t received_size);

    // Reads "bytes=0-{n}" back into a received size of n + 1.
    std::optional<std::uint64_t> parse_resume_range(std::string_view header) noexcept;

} // namespace chunkvault::protocol
