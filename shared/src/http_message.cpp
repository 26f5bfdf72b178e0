#include "chunkvault/http_message.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <sstream>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::http
{

    namespace
    {
        constexpr std::size_t kMaxLineLength = 4096;

        struct ReasonMapping
        {
            int status;
            std::string_view reason;
        };

        constexpr std::array<ReasonMapping, 20> kReasons{{
            {200, "OK"},
            {201, "Created"},
            {204, "No Content"},
            {206, "Partial Content"},
            {308, "Resume Incomplete"},
            {400, "Bad Request"},
            {401, "Unauthorized"},
            {403, "Forbidden"},
            {404, "Not Found"},
            {405, "Method Not Allowed"},
            {409, "Conflict"},
            {410, "Gone"},
            {411, "Length Required"},
            {413, "Payload Too Large"},
            {416, "Range Not Satisfiable"},
            {429, "Too Many Requests"},
            {500, "Internal Server Error"},
            {501, "Not Implemented"},
            {502, "Bad Gateway"},
            {503, "Service Unavailable"},
        }};

        bool iequals(std::string_view lhs, std::string_view rhs) noexcept
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        std::string_view trim(std::string_view value) noexcept
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        [[noreturn]] void throw_bad_head(const std::string &message)
        {
            throw UploadError(ErrorCode::InvalidPayload, message);
        }

        std::vector<std::string_view> split_lines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            while (!text.empty())
            {
                const auto pos = text.find("\r\n");
                if (pos == std::string_view::npos)
                {
                    lines.push_back(text);
                    break;
                }
                lines.push_back(text.substr(0, pos));
                text.remove_prefix(pos + 2);
            }
            return lines;
        }

        Headers parse_header_lines(const std::vector<std::string_view> &lines)
        {
            Headers headers;
            for (std::size_t i = 1; i < lines.size(); ++i)
            {
                const auto line = lines[i];
                if (line.empty())
                {
                    continue;
                }
                const auto colon = line.find(':');
                if (colon == std::string_view::npos || colon == 0)
                {
                    throw_bad_head("Malformed header line");
                }
                headers.add(std::string(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))));
            }
            return headers;
        }

        void append_headers(std::ostringstream &out, const Headers &headers)
        {
            for (const auto &[name, value] : headers.entries())
            {
                out << name << ": " << value << "\r\n";
            }
            out << "\r\n";
        }

    } // namespace

    void Headers::set(std::string name, std::string value)
    {
        remove(name);
        entries_.emplace_back(std::move(name), std::move(value));
    }

    void Headers::add(std::string name, std::string value)
    {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    void Headers::remove(std::string_view name)
    {
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const auto &entry)
                                      { return iequals(entry.first, name); }),
                       entries_.end());
    }

    std::optional<std::string> Headers::get(std::string_view name) const
    {
        for (const auto &[key, value] : entries_)
        {
            if (iequals(key, name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    bool Headers::contains(std::string_view name) const
    {
        return get(name).has_value();
    }

    RequestHead parse_request_head(std::string_view text)
    {
        const auto lines = split_lines(text);
        if (lines.empty())
        {
            throw_bad_head("Empty request");
        }
        const auto request_line = lines.front();
        const auto first_space = request_line.find(' ');
        const auto last_space = request_line.rfind(' ');
        if (first_space == std::string_view::npos || last_space == first_space)
        {
            throw_bad_head("Malformed request line");
        }
        RequestHead head;
        head.method = std::string(request_line.substr(0, first_space));
        head.target = std::string(request_line.substr(first_space + 1, last_space - first_space - 1));
        head.version = std::string(request_line.substr(last_space + 1));
        if (head.method.empty() || head.target.empty() || head.version.rfind("HTTP/1.", 0) != 0)
        {
            throw_bad_head("Malformed request line");
        }
        head.headers = parse_header_lines(lines);
        return head;
    }

    ResponseHead parse_response_head(std::string_view text)
    {
        const auto lines = split_lines(text);
        if (lines.empty())
        {
            throw_bad_head("Empty response");
        }
        const auto status_line = lines.front();
        const auto first_space = status_line.find(' ');
        if (first_space == std::string_view::npos || status_line.rfind("HTTP/1.", 0) != 0)
        {
            throw_bad_head("Malformed status line");
        }
        ResponseHead head;
        head.version = std::string(status_line.substr(0, first_space));
        auto rest = status_line.substr(first_space + 1);
        const auto second_space = rest.find(' ');
        const auto code_text = rest.substr(0, second_space);
        const auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(), head.status);
        if (ec != std::errc{} || ptr != code_text.data() + code_text.size())
        {
            throw_bad_head("Malformed status code");
        }
        if (second_space != std::string_view::npos)
        {
            head.reason = std::string(rest.substr(second_space + 1));
        }
        head.headers = parse_header_lines(lines);
        return head;
    }

    std::string serialize(const RequestHead &head)
    {
        std::ostringstream out;
        out << head.method << ' ' << head.target << ' ' << head.version << "\r\n";
        append_headers(out, head.headers);
        return out.str();
    }

    std::string serialize(const ResponseHead &head)
    {
        std::ostringstream out;
        out << head.version << ' ' << head.status << ' '
            << (head.reason.empty() ? reason_phrase(head.status) : std::string_view(head.reason)) << "\r\n";
        append_headers(out, head.headers);
        return out.str();
    }

    std::string_view reason_phrase(int status) noexcept
    {
        for (const auto &mapping : kReasons)
        {
            if (mapping.status == status)
            {
                return mapping.reason;
            }
        }
        return "Unknown";
    }

    std::optional<std::uint64_t> content_length(const Headers &headers)
    {
        const auto value = headers.get("Content-Length");
        if (!value)
        {
            return std::nullopt;
        }
        std::uint64_t length{};
        const auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), length);
        if (value->empty() || ec != std::errc{} || ptr != value->data() + value->size())
        {
            throw UploadError(ErrorCode::InvalidContentLength, "Invalid Content-Length '" + *value + "'");
        }
        return length;
    }

    bool is_chunked(const Headers &headers)
    {
        const auto value = headers.get("Transfer-Encoding");
        return value && iequals(trim(*value), "chunked");
    }

    bool wants_close(const std::string &version, const Headers &headers)
    {
        const auto connection = headers.get("Connection");
        if (connection)
        {
            if (iequals(trim(*connection), "close"))
            {
                return true;
            }
            if (iequals(trim(*connection), "keep-alive"))
            {
                return false;
            }
        }
        return version == "HTTP/1.0";
    }

    std::vector<std::string> split_path(std::string_view target)
    {
        const auto query = target.find('?');
        if (query != std::string_view::npos)
        {
            target = target.substr(0, query);
        }
        std::vector<std::string> segments;
        while (!target.empty())
        {
            const auto slash = target.find('/');
            const auto segment = target.substr(0, slash);
            if (!segment.empty())
            {
                segments.emplace_back(segment);
            }
            if (slash == std::string_view::npos)
            {
                break;
            }
            target.remove_prefix(slash + 1);
        }
        return segments;
    }

    std::string encode_chunk(std::span<const std::byte> data)
    {
        std::ostringstream out;
        out << std::hex << data.size() << "\r\n";
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out << "\r\n";
        return out.str();
    }

    std::string_view last_chunk() noexcept
    {
        return "0\r\n\r\n";
    }

    std::size_t ChunkedDecoder::feed(std::span<const char> input, std::vector<std::byte> &out)
    {
        std::size_t consumed = 0;
        while (consumed < input.size() && state_ != State::Done)
        {
            if (state_ == State::Data)
            {
                const auto available = static_cast<std::uint64_t>(input.size() - consumed);
                const auto take = static_cast<std::size_t>(std::min(available, remaining_));
                const auto *begin = reinterpret_cast<const std::byte *>(input.data() + consumed);
                out.insert(out.end(), begin, begin + take);
                consumed += take;
                remaining_ -= take;
                if (remaining_ == 0)
                {
                    state_ = State::DataEnd;
                }
                continue;
            }

            line_.push_back(input[consumed++]);
            if (line_.size() > kMaxLineLength)
            {
                throw UploadError(ErrorCode::InvalidPayload, "Chunk line too long");
            }
            if (line_.size() < 2 || line_.compare(line_.size() - 2, 2, "\r\n") != 0)
            {
                continue;
            }
            const auto line = std::string_view(line_).substr(0, line_.size() - 2);

            if (state_ == State::Size)
            {
                const auto size_text = trim(line.substr(0, line.find(';')));
                std::uint64_t size{};
                const auto [ptr, ec] = std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
                if (size_text.empty() || ec != std::errc{} || ptr != size_text.data() + size_text.size())
                {
                    throw UploadError(ErrorCode::InvalidPayload, "Malformed chunk size");
                }
                remaining_ = size;
                state_ = size == 0 ? State::Trailer : State::Data;
            }
            else if (state_ == State::DataEnd)
            {
                if (!line.empty())
                {
                    throw UploadError(ErrorCode::InvalidPayload, "Missing CRLF after chunk data");
                }
                state_ = State::Size;
            }
            else if (state_ == State::Trailer && line.empty())
            {
                state_ = State::Done;
            }
            line_.clear();
        }
        return consumed;
    }

} // namespace chunkvault::http
