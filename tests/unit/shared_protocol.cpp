#include <cassert>
#include <cstring>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/content_range.hpp"
#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/http_message.hpp"
#include "chunkvault/protocol.hpp"

using namespace chunkvault;
using namespace chunkvault::protocol;

void run_server_component_tests();
void run_client_component_tests();

namespace
{

    template <typename Fn>
    ErrorCode expect_upload_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const UploadError &ex)
        {
            return ex.code();
        }
        assert(false && "expected UploadError");
        return ErrorCode::Ok;
    }

    void test_content_range_parsing()
    {
        const auto range = parse_content_range("bytes 0-99/1000");
        assert(range.start == 0);
        assert(range.end == 99);
        assert(range.total == 1000);
        assert(range.length() == 100);

        const auto last = parse_content_range("  BYTES 900-999/1000 ");
        assert(last.start == 900 && last.length() == 100);

        const auto single = parse_content_range("bytes 5-5/6");
        assert(single.length() == 1);

        assert(expect_upload_error([]
                                   { parse_content_range("bytes 10-5/100"); }) == ErrorCode::MalformedRange);
        assert(expect_upload_error([]
                                   { parse_content_range("bytes -1-5/100"); }) == ErrorCode::MalformedRange);
        assert(expect_upload_error([]
                                   { parse_content_range("bytes 0-5"); }) == ErrorCode::MalformedRange);
        assert(expect_upload_error([]
                                   { parse_content_range("items 0-5/100"); }) == ErrorCode::MalformedRange);
        assert(expect_upload_error([]
                                   { parse_content_range("bytes */100"); }) == ErrorCode::MalformedRange);
        assert(expect_upload_error([]
                                   { parse_content_range(""); }) == ErrorCode::MalformedRange);
        assert(expect_upload_error([]
                                   { parse_content_range("bytes 0-100/100"); }) == ErrorCode::RangeExceedsTotal);

        assert(format_content_range({.start = 100, .end = 199, .total = 1000}) == "bytes 100-199/1000");
    }

    void test_resume_ranges()
    {
        assert(parse_status_query("bytes */1000") == 1000u);
        assert(!parse_status_query("bytes 0-1/1000"));
        assert(!parse_status_query("bytes */"));

        assert(!format_resume_range(0));
        assert(format_resume_range(500) == std::optional<std::string>("bytes=0-499"));
        assert(parse_resume_range("bytes=0-499") == 500u);
        assert(!parse_resume_range("bytes=10-499"));
        assert(!parse_resume_range("garbage"));
    }

    void test_error_codes()
    {
        assert(http_status(ErrorCode::OutOfOrderChunk) == 409);
        assert(http_status(ErrorCode::RangeExceedsTotal) == 416);
        assert(http_status(ErrorCode::NotFound) == 404);
        assert(http_status(ErrorCode::Forbidden) == 403);
        assert(http_status(ErrorCode::StorageFailure) == 502);
        assert(http_status(ErrorCode::InvalidContentLength) == 411);

        assert(to_string(ErrorCode::IncompleteChunk) == "incomplete_chunk");
        assert(error_code_from_string("out_of_order_chunk") == ErrorCode::OutOfOrderChunk);
        assert(error_code_from_string("nonsense") == ErrorCode::InternalError);
        assert(error_code_from_int(to_int(ErrorCode::Conflict)) == ErrorCode::Conflict);

        const UploadError error(ErrorCode::OutOfOrderChunk, "late", 42);
        assert(error.received_size() == 42u);
        assert(std::string(error.what()) == "late");
    }

    void test_protocol_payloads()
    {
        const UploadInitRequest request{.filename = "movie.mkv", .total_size = 1024, .provider = std::string("remote")};
        const auto decoded = nlohmann::json(request).get<UploadInitRequest>();
        assert(decoded.filename == "movie.mkv");
        assert(decoded.content_type == "application/octet-stream");
        assert(decoded.total_size == 1024);
        assert(decoded.provider == std::optional<std::string>("remote"));

        const auto minimal = nlohmann::json::parse(R"({"total_size": 7})").get<UploadInitRequest>();
        assert(minimal.total_size == 7);
        assert(!minimal.provider);

        const ChunkResult done{
            .complete = true,
            .received_size = 1024,
            .object = ObjectHandle{.provider = "local", .id = "abc", .size = 1024},
        };
        const auto json = nlohmann::json(done);
        assert(json.at("object").at("provider") == "local");
        assert(json.get<ChunkResult>().object == done.object);

        const ChunkResult partial{.complete = false, .received_size = 10};
        assert(!nlohmann::json(partial).contains("object"));

        const UploadProgress progress{.session_id = "s1", .status = UploadStatus::Uploading, .received_size = 3,
                                      .total_size = 9};
        const auto progress_json = nlohmann::json(progress);
        assert(progress_json.at("status") == "uploading");
        assert(progress_json.get<UploadProgress>().status == UploadStatus::Uploading);

        const ErrorBody body{.error = ErrorCode::OutOfOrderChunk, .message = "expected 5", .received_size = 5};
        const auto body_decoded = nlohmann::json(body).get<ErrorBody>();
        assert(body_decoded.error == ErrorCode::OutOfOrderChunk);
        assert(body_decoded.received_size == 5u);

        assert(is_terminal(UploadStatus::Completed));
        assert(is_terminal(UploadStatus::Cancelled));
        assert(!is_terminal(UploadStatus::Pending));
        assert(upload_status_from_string("failed") == UploadStatus::Failed);
        assert(!upload_status_from_string("paused"));
    }

    void test_http_heads()
    {
        const auto request = http::parse_request_head(
            "PUT /uploads/abc?x=1 HTTP/1.1\r\nHost: localhost\r\ncontent-range: bytes 0-9/10\r\nContent-Length: 10");
        assert(request.method == "PUT");
        assert(request.target == "/uploads/abc?x=1");
        assert(request.headers.get("Content-Range") == std::optional<std::string>("bytes 0-9/10"));
        assert(http::content_length(request.headers) == 10u);
        assert(!http::wants_close(request.version, request.headers));

        const auto segments = http::split_path(request.target);
        assert(segments.size() == 2);
        assert(segments[0] == "uploads" && segments[1] == "abc");

        http::Headers bad;
        bad.set("Content-Length", "ten");
        assert(expect_upload_error([&]
                                   { (void)http::content_length(bad); }) == ErrorCode::InvalidContentLength);
        assert(expect_upload_error([]
                                   { http::parse_request_head("GARBAGE"); }) == ErrorCode::InvalidPayload);

        http::ResponseHead response;
        response.status = 308;
        response.headers.set("Range", "bytes=0-9");
        response.headers.set("range", "bytes=0-19");
        const auto text = http::serialize(response);
        assert(text.rfind("HTTP/1.1 308 Resume Incomplete\r\n", 0) == 0);
        const auto parsed = http::parse_response_head(text.substr(0, text.size() - 4));
        assert(parsed.status == 308);
        assert(parsed.headers.get("Range") == std::optional<std::string>("bytes=0-19"));

        http::Headers close;
        close.set("Connection", "close");
        assert(http::wants_close("HTTP/1.1", close));
        assert(http::wants_close("HTTP/1.0", http::Headers{}));
    }

    void test_chunked_coding()
    {
        const std::string payload = "hello chunked world";
        const auto bytes = std::as_bytes(std::span(payload.data(), payload.size()));
        std::string wire = http::encode_chunk(bytes.first(5)) + http::encode_chunk(bytes.subspan(5)) +
                           std::string(http::last_chunk());

        http::ChunkedDecoder decoder;
        std::vector<std::byte> out;
        // One byte at a time to cross every state boundary.
        for (std::size_t i = 0; i < wire.size(); ++i)
        {
            const auto consumed = decoder.feed(std::span<const char>(wire.data() + i, 1), out);
            assert(consumed == 1);
        }
        assert(decoder.done());
        assert(out.size() == payload.size());
        assert(std::memcmp(out.data(), payload.data(), payload.size()) == 0);

        http::ChunkedDecoder broken;
        const std::string invalid = "zz\r\n";
        assert(expect_upload_error([&]
                                   { broken.feed(std::span<const char>(invalid.data(), invalid.size()), out); }) ==
               ErrorCode::InvalidPayload);
    }

    void test_crypto()
    {
        const std::vector<std::byte> data = {std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF}};
        crypto::StreamHasher whole;
        whole.update(data);
        const auto digest = whole.finish();
        assert(digest.size() == crypto::digest_hex_length());

        crypto::StreamHasher split;
        split.update(std::span(data).first(1));
        split.update(std::span(data).subspan(1));
        assert(split.finish() == digest);

        // BLAKE2b-256 of the empty input.
        crypto::StreamHasher empty;
        assert(empty.finish() == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        bool rejected = false;
        try
        {
            whole.update(data);
        }
        catch (const std::logic_error &)
        {
            rejected = true;
        }
        assert(rejected);

        const auto a = crypto::random_token(16);
        const auto b = crypto::random_token(16);
        assert(a.size() == 32);
        assert(a != b);
    }

} // namespace

int main()
{
    try
    {
        test_content_range_parsing();
        test_resume_ranges();
        test_error_codes();
        test_protocol_payloads();
        test_http_heads();
        test_chunked_coding();
        test_crypto();
        run_server_component_tests();
        run_client_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
