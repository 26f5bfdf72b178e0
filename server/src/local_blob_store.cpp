#include "chunkvault/server/local_blob_store.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "chunkvault/crypto.hpp"
#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    namespace
    {
        constexpr auto kStagingDir = "staging";
        constexpr auto kObjectsDir = "objects";
        constexpr auto kStagingSuffix = ".part";

        bool is_object_id(std::string_view id)
        {
            return id.size() == crypto::digest_hex_length() &&
                   std::all_of(id.begin(), id.end(), [](char c)
                               { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
        }

        class LocalBlobSink : public BlobSink
        {
        public:
            LocalBlobSink(std::filesystem::path staging_path, std::filesystem::path objects_dir)
                : staging_path_(std::move(staging_path)), objects_dir_(std::move(objects_dir)),
                  out_(staging_path_, std::ios::binary | std::ios::trunc)
            {
                if (!out_.is_open())
                {
                    throw UploadError(ErrorCode::StorageFailure,
                                      "Failed to create staging file " + staging_path_.string());
                }
            }

            ~LocalBlobSink() override
            {
                if (!released_)
                {
                    abort();
                }
            }

            void write(std::span<const std::byte> data) override
            {
                out_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!out_)
                {
                    throw UploadError(ErrorCode::StorageFailure, "Failed to write " + staging_path_.string());
                }
                hasher_.update(data);
                size_ += data.size();
            }

            ObjectHandle finalize() override
            {
                out_.close();
                if (out_.fail())
                {
                    throw UploadError(ErrorCode::StorageFailure, "Failed to flush " + staging_path_.string());
                }

                const auto id = hasher_.finish();
                const auto target_dir = objects_dir_ / id.substr(0, 2);
                const auto target = target_dir / id;
                std::error_code ec;
                std::filesystem::create_directories(target_dir, ec);
                if (ec)
                {
                    throw UploadError(ErrorCode::StorageFailure, "Failed to create " + target_dir.string() + ": " +
                                                                     ec.message());
                }

                if (std::filesystem::exists(target, ec))
                {
                    std::filesystem::remove(staging_path_, ec);
                    spdlog::debug("Object {} already stored, dropped duplicate", id);
                }
                else
                {
                    std::filesystem::rename(staging_path_, target, ec);
                    if (ec)
                    {
                        throw UploadError(ErrorCode::StorageFailure,
                                          "Failed to move object into place: " + ec.message());
                    }
                }
                released_ = true;
                return {.provider = std::string(LocalBlobStore::kProvider), .id = id, .size = size_};
            }

            void abort() noexcept override
            {
                released_ = true;
                out_.close();
                std::error_code ec;
                std::filesystem::remove(staging_path_, ec);
                if (ec)
                {
                    spdlog::warn("Failed to remove staging file {}: {}", staging_path_.string(), ec.message());
                }
            }

        private:
            std::filesystem::path staging_path_;
            std::filesystem::path objects_dir_;
            std::ofstream out_;
            crypto::StreamHasher hasher_;
            std::uint64_t size_{};
            bool released_{false};
        };

        class FileByteStream : public ByteStream
        {
        public:
            explicit FileByteStream(const std::filesystem::path &path) : in_(path, std::ios::binary)
            {
                if (!in_.is_open())
                {
                    throw UploadError(ErrorCode::NotFound, "Object not found");
                }
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                if (buffer.empty() || !in_)
                {
                    return 0;
                }
                in_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (in_.bad())
                {
                    throw UploadError(ErrorCode::StorageFailure, "Failed to read object");
                }
                return static_cast<std::size_t>(in_.gcount());
            }

        private:
            std::ifstream in_;
        };

    } // namespace

    LocalBlobStore::LocalBlobStore(std::filesystem::path root)
        : root_(std::move(root)), staging_dir_(root_ / kStagingDir), objects_dir_(root_ / kObjectsDir)
    {
        std::filesystem::create_directories(staging_dir_);
        std::filesystem::create_directories(objects_dir_);
    }

    std::unique_ptr<BlobSink> LocalBlobStore::open_sink(const ObjectMetadata &metadata)
    {
        auto staging_path = staging_dir_ / (crypto::random_token() + kStagingSuffix);
        spdlog::debug("Staging '{}' for {} at {}", metadata.filename, metadata.owner_id, staging_path.string());
        return std::make_unique<LocalBlobSink>(std::move(staging_path), objects_dir_);
    }

    std::unique_ptr<ByteStream> LocalBlobStore::open_read_stream(const ObjectHandle &handle)
    {
        const auto path = checked_object_path(handle);
        if (!std::filesystem::is_regular_file(path))
        {
            throw UploadError(ErrorCode::NotFound, "Object not found");
        }
        return std::make_unique<FileByteStream>(path);
    }

    void LocalBlobStore::remove(const ObjectHandle &handle)
    {
        const auto path = checked_object_path(handle);
        std::error_code ec;
        if (!std::filesystem::remove(path, ec))
        {
            if (ec)
            {
                throw UploadError(ErrorCode::StorageFailure, "Failed to delete object: " + ec.message());
            }
            throw UploadError(ErrorCode::NotFound, "Object not found");
        }
    }

    std::size_t LocalBlobStore::cleanup_staging(std::chrono::seconds max_age)
    {
        const auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;
        std::size_t removed = 0;
        for (const auto &entry : std::filesystem::directory_iterator(staging_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != kStagingSuffix)
            {
                continue;
            }
            std::error_code ec;
            const auto modified = entry.last_write_time(ec);
            if (ec || modified > cutoff)
            {
                continue;
            }
            if (std::filesystem::remove(entry.path(), ec))
            {
                ++removed;
            }
            else if (ec)
            {
                spdlog::warn("Failed to remove stale staging file {}: {}", entry.path().string(), ec.message());
            }
        }
        if (removed > 0)
        {
            spdlog::info("Removed {} stale staging files", removed);
        }
        return removed;
    }

    std::filesystem::path LocalBlobStore::object_path(const std::string &id) const
    {
        return objects_dir_ / id.substr(0, 2) / id;
    }

    std::filesystem::path LocalBlobStore::checked_object_path(const ObjectHandle &handle) const
    {
        if (handle.provider != kProvider || !is_object_id(handle.id))
        {
            throw UploadError(ErrorCode::NotFound, "Object not found");
        }
        return object_path(handle.id);
    }

} // namespace chunkvault::server
