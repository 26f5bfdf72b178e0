#include "chunkvault/client/session.hpp"

#include <cstdlib>
#include <iostream>

#include <nlohmann/json.hpp>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::client
{

    namespace
    {

        std::string resolve_owner(const ClientConfig &config)
        {
            if (config.owner && !config.owner->empty())
            {
                return *config.owner;
            }
            if (const char *user = std::getenv("USER"))
            {
                return user;
            }
            return "anonymous";
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          state_store_(config_.state_path),
          owner_(resolve_owner(config_)),
          api_(config_.host, config_.port, owner_) {}

    int ClientSession::run()
    {
        try
        {
            logger_.log("info", "command ", config_.command, " as ", owner_, " against ", api_.endpoint());
            return dispatch(config_.command, config_.arguments) ? 0 : 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "upload")
        {
            return handle_upload(args);
        }
        if (command == "resume")
        {
            return handle_resume();
        }
        if (command == "status")
        {
            return handle_status(args);
        }
        if (command == "cancel")
        {
            return handle_cancel(args);
        }
        if (command == "download")
        {
            return handle_download(args);
        }
        if (command == "delete")
        {
            return handle_delete(args);
        }
        std::cerr << "Unknown command: " << command << "\n"
                  << usage();
        return false;
    }

    bool ClientSession::handle_status(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cerr << "Usage: status <session>" << std::endl;
            return false;
        }
        const auto response = api_.send("GET", "/uploads/" + args[0]);
        if (response.status != 200)
        {
            print_error(response);
            return false;
        }
        const auto progress = nlohmann::json::parse(response.body).get<protocol::UploadProgress>();
        std::cout << progress.session_id << " " << protocol::to_string(progress.status) << " "
                  << progress.received_size << "/" << progress.total_size << std::endl;
        return true;
    }

    bool ClientSession::handle_cancel(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cerr << "Usage: cancel <session>" << std::endl;
            return false;
        }
        const auto response = api_.send("DELETE", "/uploads/" + args[0]);
        if (response.status != 204)
        {
            print_error(response);
            return false;
        }
        state_store_.remove(args[0]);
        logger_.log("info", "cancelled ", args[0]);
        std::cout << "OK" << std::endl;
        return true;
    }

    bool ClientSession::handle_delete(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cerr << "Usage: delete <provider>/<id>" << std::endl;
            return false;
        }
        const auto response = api_.send("DELETE", object_target(args[0]));
        if (response.status != 204)
        {
            print_error(response);
            return false;
        }
        logger_.log("info", "deleted ", args[0]);
        std::cout << "OK" << std::endl;
        return true;
    }

    void ClientSession::print_error(const ApiResponse &response) const
    {
        if (const auto error = response.error())
        {
            std::cerr << "ERROR: " << to_string(error->error) << ": " << error->message << std::endl;
            return;
        }
        std::cerr << "ERROR: HTTP " << response.status << std::endl;
    }

    std::string ClientSession::object_target(const std::string &reference) const
    {
        const auto slash = reference.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == reference.size())
        {
            throw std::runtime_error("Expected an object reference <provider>/<id>, got " + reference);
        }
        return "/objects/" + reference;
    }

} // namespace chunkvault::client
