#include <iostream>

#include "chunkvault/client/config.hpp"
#include "chunkvault/client/logger.hpp"
#include "chunkvault/client/session.hpp"

int main(int argc, char *argv[])
{
    using namespace chunkvault::client;

    try
    {
        auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        ClientSession session(std::move(config), std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
