#include "chunkvault/content_range.hpp"

#include <cctype>
#include <charconv>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::protocol
{

    namespace
    {
        constexpr std::string_view kUnit = "bytes";

        std::string_view trim(std::string_view value) noexcept
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        bool iequals(std::string_view lhs, std::string_view rhs) noexcept
        {
            if (lhs.size() != rhs.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
                {
                    return false;
                }
            }
            return true;
        }

        // Digits only: a sign, a blank or an overflow all fail.
        std::optional<std::uint64_t> parse_number(std::string_view text) noexcept
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            for (const char ch : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(ch)))
                {
                    return std::nullopt;
                }
            }
            std::uint64_t value{};
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        // Strips the unit token and the separator that follows it.
        std::optional<std::string_view> strip_unit(std::string_view header, char separator) noexcept
        {
            header = trim(header);
            if (header.size() <= kUnit.size() || !iequals(header.substr(0, kUnit.size()), kUnit))
            {
                return std::nullopt;
            }
            header.remove_prefix(kUnit.size());
            if (header.front() != separator)
            {
                return std::nullopt;
            }
            header.remove_prefix(1);
            return trim(header);
        }

        [[noreturn]] void throw_malformed(std::string_view header, std::string_view reason)
        {
            throw UploadError(ErrorCode::MalformedRange,
                              "Malformed Content-Range '" + std::string(header) + "': " + std::string(reason));
        }

    } // namespace

    ChunkRange parse_content_range(std::string_view header)
    {
        const auto spec = strip_unit(header, ' ');
        if (!spec)
        {
            throw_malformed(header, "expected 'bytes start-end/total'");
        }

        const auto slash = spec->find('/');
        const auto dash = spec->find('-');
        if (slash == std::string_view::npos || dash == std::string_view::npos || dash > slash)
        {
            throw_malformed(header, "expected 'bytes start-end/total'");
        }

        const auto start = parse_number(spec->substr(0, dash));
        const auto end = parse_number(spec->substr(dash + 1, slash - dash - 1));
        const auto total = parse_number(spec->substr(slash + 1));
        if (!start || !end || !total)
        {
            throw_malformed(header, "offsets must be non-negative integers");
        }
        if (*end < *start)
        {
            throw_malformed(header, "end precedes start");
        }
        if (*end >= *total)
        {
            throw UploadError(ErrorCode::RangeExceedsTotal,
                              "Range end " + std::to_string(*end) + " is outside total " + std::to_string(*total));
        }
        return ChunkRange{.start = *start, .end = *end, .total = *total};
    }

    std::optional<std::uint64_t> parse_status_query(std::string_view header) noexcept
    {
        const auto spec = strip_unit(header, ' ');
        if (!spec || spec->size() < 3 || spec->substr(0, 2) != "*/")
        {
            return std::nullopt;
        }
        return parse_number(spec->substr(2));
    }

    std::string format_content_range(const ChunkRange &range)
    {
        return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
               std::to_string(range.total);
    }

    std::optional<std::string> format_resume_range(std::uint64_t received_size)
    {
        if (received_size == 0)
        {
            return std::nullopt;
        }
        return "bytes=0-" + std::to_string(received_size - 1);
    }

    std::optional<std::uint64_t> parse_resume_range(std::string_view header) noexcept
    {
        const auto spec = strip_unit(header, '=');
        if (!spec || spec->size() < 3 || spec->substr(0, 2) != "0-")
        {
            return std::nullopt;
        }
        const auto last = parse_number(spec->substr(2));
        if (!last)
        {
            return std::nullopt;
        }
        return *last + 1;
    }

} // namespace chunkvault::protocol
