#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/client/api_client.hpp"
#include "chunkvault/client/config.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/transfer_state_store.hpp"
#include "chunkvault/protocol.hpp"

namespace chunkvault::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_upload(const std::vector<std::string> &args);
        bool handle_resume();
        bool handle_status(const std::vector<std::string> &args);
        bool handle_cancel(const std::vector<std::string> &args);
        bool handle_download(const std::vector<std::string> &args);
        bool handle_delete(const std::vector<std::string> &args);

        std::string start_upload(const std::filesystem::path &local_path, std::uint64_t total_size,
                                 const std::optional<std::string> &provider);
        // Returns the server's resume point, or nullopt when the session is gone.
        std::optional<std::uint64_t> query_resume_point(const std::string &session_id, std::uint64_t total_size);
        bool send_chunks(TransferStateStore::Entry entry);

        void print_error(const ApiResponse &response) const;
        std::string object_target(const std::string &reference) const;

        ClientConfig config_;
        Logger logger_;
        TransferStateStore state_store_;
        std::string owner_;
        ApiClient api_;
    };

} // namespace chunkvault::client
