#include "chunkvault/server/server.hpp"

#include <asio/ip/address.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "chunkvault/server/http_session.hpp"

namespace chunkvault::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        UploadEngineOptions engine_options(const ServerConfig &config)
        {
            return {
                .sink = {.high_water_mark = config.high_water_mark, .write_size = config.write_size},
                .idle_timeout = config.idle_timeout,
                .max_upload_size = config.max_upload_size,
            };
        }

        std::unique_ptr<CurlTransport> make_transport(const ServerConfig &config)
        {
            if (!config.remote)
            {
                return nullptr;
            }
            return std::make_unique<CurlTransport>();
        }

        std::unique_ptr<RemoteBlobStore> make_remote_store(const ServerConfig &config, CurlTransport *transport)
        {
            if (!config.remote || !transport)
            {
                return nullptr;
            }
            return std::make_unique<RemoteBlobStore>(*config.remote, *transport);
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          local_store_(config_.root),
          transport_(make_transport(config_)),
          remote_store_(make_remote_store(config_, transport_.get())),
          blob_store_(local_store_, remote_store_.get(), config_.remote_threshold),
          engine_(blob_store_, engine_options(config_)),
          reaper_(io_context_, engine_, config_.reap_interval)
    {
        // The registry is in-memory, so nothing left in staging/ can be resumed.
        local_store_.cleanup_staging(std::chrono::seconds{0});

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, config_.port, config_.root.string());
        if (remote_store_)
        {
            spdlog::info("Remote store enabled for uploads above {} bytes", config_.remote_threshold);
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        reaper_.start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }

        const auto aborted = engine_.shutdown("server shutting down");
        spdlog::info("Server stopped, {} unfinished uploads aborted", aborted);
    }

    std::uint16_t Server::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto session = std::make_shared<HttpSession>(std::move(socket), HttpServices{engine_});
            session->start();
        }
        if (!ec || ec == asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        reaper_.stop();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace chunkvault::server
