#include "ArenaApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        ArenaApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Stake Arena Simulation Starting" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        int code = app.run(argc, argv);

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Stake Arena Simulation Finished" << std::endl;
        std::cout << "========================================" << std::endl;

        return code;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
