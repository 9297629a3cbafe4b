#include "ReplayApp.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
    try
    {
        cpq::ReplayApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  CPQ Replay v1.0.0" << std::endl;
        std::cout << "  Usage: cpq-replay [catalog.json] [events.json]" << std::endl;
        std::cout << "========================================" << std::endl;

        int code = app.run(argc, argv);
        std::cout << "[main] Replay finished with code " << code << std::endl;
        return code;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
