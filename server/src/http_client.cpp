#include "chunkvault/server/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace chunkvault::server
{

    namespace
    {

        void ensure_curl_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []
                           {
                if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
                {
                    throw std::runtime_error("curl_global_init failed");
                } });
        }

        struct BodyReader
        {
            const std::string *body;
            std::size_t offset{};
        };

        std::size_t write_callback(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *body = static_cast<std::string *>(userdata);
            const auto bytes = size * nmemb;
            body->append(ptr, bytes);
            return bytes;
        }

        std::size_t read_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *reader = static_cast<BodyReader *>(userdata);
            const auto count = std::min(size * nitems, reader->body->size() - reader->offset);
            if (count > 0)
            {
                std::memcpy(buffer, reader->body->data() + reader->offset, count);
                reader->offset += count;
            }
            return count;
        }

        std::size_t header_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *headers = static_cast<http::Headers *>(userdata);
            const auto bytes = size * nitems;
            std::string line(buffer, bytes);
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            {
                line.pop_back();
            }
            if (line.starts_with("HTTP/"))
            {
                // A new response head (after a redirect or 100 Continue) replaces the previous one.
                *headers = http::Headers{};
                return bytes;
            }
            const auto colon = line.find(':');
            if (colon == std::string::npos)
            {
                return bytes;
            }
            auto value = line.substr(colon + 1);
            const auto first = value.find_first_not_of(" \t");
            value = first == std::string::npos ? std::string{} : value.substr(first);
            headers->add(line.substr(0, colon), std::move(value));
            return bytes;
        }

    } // namespace

    bool is_retryable_status(int status) noexcept
    {
        return status == 429 || (status >= 500 && status < 600);
    }

    std::string url_encode(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size());
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                encoded.push_back(ch);
            }
            else
            {
                encoded.push_back('%');
                encoded.push_back(kHexDigits[c >> 4]);
                encoded.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return encoded;
    }

    CurlTransport::CurlTransport(CurlTransportOptions options) : options_(std::move(options))
    {
        ensure_curl_init();
    }

    HttpResponse CurlTransport::perform(const HttpRequest &request)
    {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl)
        {
            throw TransportError("curl_easy_init failed");
        }
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, &curl_slist_free_all);
        std::vector<std::string> lines;
        for (const auto &[name, value] : request.headers.entries())
        {
            lines.push_back(name + ": " + value);
        }
        // Keep curl from sending "Expect: 100-continue" on uploads.
        lines.emplace_back("Expect:");
        for (const auto &line : lines)
        {
            auto *appended = curl_slist_append(header_list.get(), line.c_str());
            if (!appended)
            {
                throw TransportError("curl_slist_append failed");
            }
            header_list.release();
            header_list.reset(appended);
        }

        HttpResponse response;
        BodyReader reader{.body = &request.body};
        auto *handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

        if (request.method == "GET")
        {
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
        }
        else if (request.method == "POST")
        {
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
        else if (request.method == "PUT")
        {
            curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(handle, CURLOPT_READDATA, &reader);
            curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
        else
        {
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            if (!request.body.empty())
            {
                curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            }
        }

        const auto result = curl_easy_perform(handle);
        if (result != CURLE_OK)
        {
            throw TransportError(std::string(request.method) + " " + request.url + ": " + curl_easy_strerror(result));
        }
        long status = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);
        return response;
    }

    HttpResponse perform_with_retry(HttpTransport &transport, const HttpRequest &request, const RetryPolicy &policy)
    {
        auto delay = policy.initial_delay;
        for (int attempt = 0;; ++attempt)
        {
            try
            {
                auto response = transport.perform(request);
                if (!is_retryable_status(response.status) || attempt >= policy.max_retries)
                {
                    return response;
                }
                spdlog::warn("{} {} returned {}, retrying in {} ms", request.method, request.url, response.status,
                             delay.count());
            }
            catch (const TransportError &ex)
            {
                if (attempt >= policy.max_retries)
                {
                    throw;
                }
                spdlog::warn("{}, retrying in {} ms", ex.what(), delay.count());
            }
            std::this_thread::sleep_for(delay);
            delay = std::chrono::milliseconds(
                static_cast<std::chrono::milliseconds::rep>(static_cast<double>(delay.count()) * policy.backoff_multiplier));
        }
    }

} // namespace chunkvault::server
