#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <cstdint>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

#include "chunkvault/server/config.hpp"
#include "chunkvault/server/http_client.hpp"
#include "chunkvault/server/idle_reaper.hpp"
#include "chunkvault/server/local_blob_store.hpp"
#include "chunkvault/server/remote_blob_store.hpp"
#include "chunkvault/server/routing_blob_store.hpp"
#include "chunkvault/server/upload_engine.hpp"

namespace chunkvault::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

        std::uint16_t port() const;

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;

        LocalBlobStore local_store_;
        std::unique_ptr<CurlTransport> transport_;
        std::unique_ptr<RemoteBlobStore> remote_store_;
        RoutingBlobStore blob_store_;
        UploadEngine engine_;
        IdleReaper reaper_;

        std::vector<std::thread> workers_;
    };

} // namespace chunkvault::server
