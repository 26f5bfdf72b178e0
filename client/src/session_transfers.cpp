#include "chunkvault/client/session.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <span>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "chunkvault/content_range.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::client
{

    namespace
    {
        constexpr int kMaxReconnects = 3;
        constexpr int kMaxResyncs = 8;
    } // namespace

    bool ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cerr << "Usage: upload <file> [--provider local|remote] [--chunk-size <bytes>]" << std::endl;
            return false;
        }
        const std::filesystem::path local_path(args[0]);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_path, ec))
        {
            std::cerr << "ERROR: not a regular file: " << local_path.string() << std::endl;
            return false;
        }
        const auto total_size = std::filesystem::file_size(local_path);
        if (total_size == 0)
        {
            std::cerr << "ERROR: empty files cannot be uploaded" << std::endl;
            return false;
        }

        TransferStateStore::Entry entry{
            .session_id = start_upload(local_path, total_size, config_.provider),
            .owner = owner_,
            .endpoint = api_.endpoint(),
            .local_path = local_path,
            .provider = config_.provider,
            .total_size = total_size,
            .bytes_sent = 0,
        };
        state_store_.upsert(entry);
        std::cout << "Session " << entry.session_id << std::endl;
        return send_chunks(std::move(entry));
    }

    bool ClientSession::handle_resume()
    {
        const auto entries = state_store_.pending(owner_, api_.endpoint());
        if (entries.empty())
        {
            std::cout << "Nothing to resume" << std::endl;
            return true;
        }

        bool all_ok = true;
        for (auto entry : entries)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(entry.local_path, ec) ||
                std::filesystem::file_size(entry.local_path, ec) != entry.total_size)
            {
                std::cerr << "[warning] " << entry.local_path.string() << " is missing or changed, dropping upload "
                          << entry.session_id << std::endl;
                state_store_.remove(entry.session_id);
                all_ok = false;
                continue;
            }

            const auto resume_point = query_resume_point(entry.session_id, entry.total_size);
            if (resume_point)
            {
                entry.bytes_sent = *resume_point;
            }
            else
            {
                // Reaped, failed or lost in a server restart: start over.
                std::cout << "Session " << entry.session_id << " is gone, restarting " << entry.local_path.string()
                          << std::endl;
                state_store_.remove(entry.session_id);
                entry.session_id = start_upload(entry.local_path, entry.total_size, entry.provider);
                entry.bytes_sent = 0;
            }
            state_store_.upsert(entry);
            logger_.log("info", "resuming ", entry.session_id, " at ", entry.bytes_sent, "/", entry.total_size);
            all_ok = send_chunks(std::move(entry)) && all_ok;
        }
        return all_ok;
    }

    bool ClientSession::handle_download(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            std::cerr << "Usage: download <provider>/<id> <file>" << std::endl;
            return false;
        }
        const std::filesystem::path target(args[1]);
        auto partial = target;
        partial += ".part";

        std::uint64_t received = 0;
        ApiResponse response;
        {
            std::ofstream out(partial, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                std::cerr << "ERROR: cannot write " << partial.string() << std::endl;
                return false;
            }
            response = api_.fetch(object_target(args[0]), [&](std::span<const std::byte> data)
                                  {
                out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!out)
                {
                    throw std::runtime_error("Failed writing " + partial.string());
                }
                received += data.size(); });
        }

        std::error_code ec;
        if (response.status != 200)
        {
            std::filesystem::remove(partial, ec);
            print_error(response);
            return false;
        }
        std::filesystem::rename(partial, target, ec);
        if (ec)
        {
            std::cerr << "ERROR: cannot move download into place: " << ec.message() << std::endl;
            return false;
        }
        logger_.log("info", "downloaded ", args[0], " (", received, " bytes)");
        std::cout << "Downloaded " << received << " bytes to " << target.string() << std::endl;
        return true;
    }

    std::string ClientSession::start_upload(const std::filesystem::path &local_path, std::uint64_t total_size,
                                            const std::optional<std::string> &provider)
    {
        const protocol::UploadInitRequest request{
            .filename = local_path.filename().string(),
            .total_size = total_size,
            .provider = provider,
        };
        http::Headers headers;
        headers.set("Content-Type", "application/json");
        const auto response = api_.send("POST", "/uploads", std::move(headers), nlohmann::json(request).dump());
        if (response.status != 201)
        {
            print_error(response);
            throw std::runtime_error("Upload could not be started");
        }
        const auto init = nlohmann::json::parse(response.body).get<protocol::UploadInitResponse>();
        logger_.log("info", "started ", init.session_id, " for ", local_path.string(), " (", total_size, " bytes)");
        return init.session_id;
    }

    std::optional<std::uint64_t> ClientSession::query_resume_point(const std::string &session_id,
                                                                   std::uint64_t total_size)
    {
        http::Headers headers;
        headers.set("Content-Range", "bytes */" + std::to_string(total_size));
        const auto response = api_.send("PUT", "/uploads/" + session_id, std::move(headers));
        if (response.status == 308)
        {
            const auto range = response.headers.get("Range");
            return range ? protocol::parse_resume_range(*range).value_or(0) : 0;
        }
        if (response.status == 404)
        {
            return std::nullopt;
        }
        print_error(response);
        throw std::runtime_error("Resume point query failed for " + session_id);
    }

    bool ClientSession::send_chunks(TransferStateStore::Entry entry)
    {
        std::ifstream in(entry.local_path, std::ios::binary);
        if (!in.is_open())
        {
            std::cerr << "ERROR: cannot read " << entry.local_path.string() << std::endl;
            return false;
        }

        const auto target = "/uploads/" + entry.session_id;
        std::uint64_t offset = entry.bytes_sent;
        std::string chunk;
        int reconnects = 0;
        int resyncs = 0;
        while (offset < entry.total_size)
        {
            const auto length = static_cast<std::size_t>(
                std::min<std::uint64_t>(config_.chunk_size, entry.total_size - offset));
            chunk.resize(length);
            in.clear();
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(chunk.data(), static_cast<std::streamsize>(length));
            if (static_cast<std::size_t>(in.gcount()) != length)
            {
                std::cerr << "ERROR: " << entry.local_path.string() << " changed during upload" << std::endl;
                return false;
            }

            http::Headers headers;
            headers.set("Content-Type", "application/octet-stream");
            headers.set("Content-Range", protocol::format_content_range({offset, offset + length - 1, entry.total_size}));

            ApiResponse response;
            try
            {
                response = api_.send("PUT", target, std::move(headers), chunk);
            }
            catch (const std::system_error &ex)
            {
                if (++reconnects > kMaxReconnects)
                {
                    std::cerr << "ERROR: " << ex.what() << "; run `resume` to continue" << std::endl;
                    return false;
                }
                logger_.log("warn", "connection lost during ", entry.session_id, ": ", ex.what());
                api_.close();
                const auto resume_point = query_resume_point(entry.session_id, entry.total_size);
                if (!resume_point)
                {
                    std::cerr << "ERROR: upload session expired; run `resume` to restart" << std::endl;
                    return false;
                }
                offset = *resume_point;
                state_store_.update_progress(entry.session_id, offset);
                continue;
            }

            if (response.status == 308)
            {
                const auto range = response.headers.get("Range");
                offset = range ? protocol::parse_resume_range(*range).value_or(0) : 0;
                state_store_.update_progress(entry.session_id, offset);
                reconnects = 0;
                std::cout << "\r" << offset << "/" << entry.total_size << " bytes" << std::flush;
                continue;
            }
            if (response.status == 200)
            {
                const auto result = nlohmann::json::parse(response.body).get<protocol::ChunkResult>();
                state_store_.remove(entry.session_id);
                std::cout << "\r" << entry.total_size << "/" << entry.total_size << " bytes" << std::endl;
                if (result.object)
                {
                    std::cout << "Stored as " << result.object->provider << "/" << result.object->id << " ("
                              << result.object->size << " bytes)" << std::endl;
                    logger_.log("info", "completed ", entry.session_id, " as ", result.object->provider, "/",
                                result.object->id);
                }
                return true;
            }

            const auto error = response.error();
            if (error && error->received_size &&
                (error->error == ErrorCode::OutOfOrderChunk || error->error == ErrorCode::IncompleteChunk) &&
                ++resyncs <= kMaxResyncs)
            {
                offset = *error->received_size;
                state_store_.update_progress(entry.session_id, offset);
                logger_.log("warn", "resynchronised ", entry.session_id, " at ", offset);
                continue;
            }
            std::cout << std::endl;
            print_error(response);
            if (response.status == 404 || response.status == 410 || response.status == 502)
            {
                // The session no longer exists on the server.
                state_store_.remove(entry.session_id);
            }
            return false;
        }

        std::cerr << "ERROR: server accepted every byte of " << entry.session_id << " without completing it"
                  << std::endl;
        return false;
    }

} // namespace chunkvault::client
