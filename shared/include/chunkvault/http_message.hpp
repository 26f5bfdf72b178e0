/**
 * chunkvault - Minimal HTTP/1.1 message heads and chunked transfer coding.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkvault::http
{

    constexpr std::size_t kMaxHeadSize = 16 * 1024;
    constexpr std::string_view kHeadTerminator = "\r\n\r\n";

    class Headers
    {
    public:
        // Replaces every existing value of name.
        void set(std::string name, std::string value);
        void add(std::string name, std::string value);
        void remove(std::string_view name);

        std::optional<std::string> get(std::string_view name) const;
        bool contains(std::string_view name) const;

        const std::vector<std::pair<std::string, std::string>> &entries() const noexcept { return entries_; }

    private:
        std::vector<std::pair<std::string, std::string>> entries_;
    };

    struct RequestHead
    {
        std::string method;
        std::string target;
        std::string version{"HTTP/1.1"};
        Headers headers;
    };

    struct ResponseHead
    {
        int status{200};
        std::string reason;
        std::string version{"HTTP/1.1"};
        Headers headers;
    };

    // Both parsers expect the head without the blank line terminator and throw UploadError(InvalidPayload).
    RequestHead parse_request_head(std::string_view text);
    ResponseHead parse_response_head(std::string_view text);

    std::string serialize(const RequestHead &head);
    std::string serialize(const ResponseHead &head);

    std::string_view reason_phrase(int status) noexcept;

    // Throws UploadError(InvalidContentLength) for a present but unparsable value.
    std::optional<std::uint64_t> content_length(const Headers &headers);

    bool is_chunked(const Headers &headers);

    bool wants_close(const std::string &version, const Headers &headers);

    // Splits "/a/b/c?x=1" into path segments, dropping the query.
    std::vector<std::string> split_path(std::string_view target);

    std::string encode_chunk(std::span<const std::byte> data);
    std::string_view last_chunk() noexcept;

    class ChunkedDecoder
    {
    public:
        // Appends decoded payload to out and returns the number of input bytes consumed.
        std::size_t feed(std::span<const char> input, std::vector<std::byte> &out);

        bool done() const noexcept { return state_ == State::Done; }

    private:
        enum class State
        {
            Size,
            Data,
            DataEnd,
            Trailer,
            Done
        };

        State state_{State::Size};
        std::string line_;
        std::uint64_t remaining_{};
    };

} // namespace chunkvault::http
