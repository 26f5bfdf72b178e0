#include "chunkvault/client/transfer_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace chunkvault::client
{

    namespace
    {

        std::filesystem::path normalize_path(const std::filesystem::path &path)
        {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(path, ec);
            if (ec)
            {
                return path.lexically_normal();
            }
            return absolute.lexically_normal();
        }

    } // namespace

    TransferStateStore::TransferStateStore(std::optional<std::filesystem::path> path)
        : state_path_(path ? std::move(*path) : default_state_path())
    {
        load();
    }

    std::vector<TransferStateStore::Entry> TransferStateStore::pending(const std::string &owner,
                                                                       const std::string &endpoint) const
    {
        std::vector<Entry> result;
        for (const auto &entry : entries_)
        {
            if (entry.owner == owner && entry.endpoint == endpoint)
            {
                result.push_back(entry);
            }
        }
        return result;
    }

    std::optional<TransferStateStore::Entry> TransferStateStore::find(const std::string &session_id) const
    {
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                               { return entry.session_id == session_id; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    void TransferStateStore::upsert(Entry entry)
    {
        entry.local_path = normalize_path(entry.local_path);
        auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &existing)
                               { return existing.session_id == entry.session_id; });
        if (it != entries_.end())
        {
            *it = std::move(entry);
        }
        else
        {
            entries_.push_back(std::move(entry));
        }
        save();
    }

    void TransferStateStore::update_progress(const std::string &session_id, std::uint64_t bytes_sent)
    {
        for (auto &entry : entries_)
        {
            if (entry.session_id == session_id)
            {
                entry.bytes_sent = bytes_sent;
                save();
                return;
            }
        }
    }

    void TransferStateStore::remove(const std::string &session_id)
    {
        const auto before = entries_.size();
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                      { return entry.session_id == session_id; }),
                       entries_.end());
        if (entries_.size() != before)
        {
            save();
        }
    }

    std::filesystem::path TransferStateStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".chunkvault" / "uploads.json";
        }
        return std::filesystem::path(".chunkvault") / "uploads.json";
    }

    void TransferStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_array())
        {
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.session_id = item.value("session", std::string{});
            entry.owner = item.value("owner", std::string{});
            entry.endpoint = item.value("endpoint", std::string{});
            entry.local_path = std::filesystem::path(item.value("local", std::string{}));
            if (item.contains("provider") && item.at("provider").is_string())
            {
                entry.provider = item.at("provider").get<std::string>();
            }
            entry.total_size = item.value("total", 0ULL);
            entry.bytes_sent = item.value("bytes", 0ULL);
            if (!entry.session_id.empty() && !entry.owner.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void TransferStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            nlohmann::json item = {{"session", entry.session_id},
                                   {"owner", entry.owner},
                                   {"endpoint", entry.endpoint},
                                   {"local", entry.local_path.generic_string()},
                                   {"total", entry.total_size},
                                   {"bytes", entry.bytes_sent}};
            if (entry.provider)
            {
                item["provider"] = *entry.provider;
            }
            json.push_back(std::move(item));
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Cannot write transfer state to " + state_path_.string());
        }
        out << json.dump(2);
    }

} // namespace chunkvault::client
