#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::client
{

    // Unfinished uploads, persisted as JSON so that `resume` can pick them up in a later run.
    class TransferStateStore
    {
    public:
        struct Entry
        {
            std::string session_id;
            std::string owner;
            std::string endpoint;
            std::filesystem::path local_path;
            std::optional<std::string> provider;
            std::uint64_t total_size{};
            std::uint64_t bytes_sent{};
        };

        // Defaults to ~/.chunkvault/uploads.json.
        explicit TransferStateStore(std::optional<std::filesystem::path> path = std::nullopt);

        std::vector<Entry> pending(const std::string &owner, const std::string &endpoint) const;

        std::optional<Entry> find(const std::string &session_id) const;

        void upsert(Entry entry);

        void update_progress(const std::string &session_id, std::uint64_t bytes_sent);

        void remove(const std::string &session_id);

        const std::filesystem::path &path() const noexcept { return state_path_; }

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace chunkvault::client
