#include "TicketsApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        cinema::TicketsApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Cinema Tickets v1.0.0" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        app.run(argc, argv);

        std::cout << "[main] Cinema Tickets finished" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
