/**
 * @fileoverview main.cpp
 * @brief Main entry point for the native application.
 *
 * Creates a GameManager, initializes it, and runs the main loop.
 */

#include <exception>
#include <iostream>

#include "relativity/core/game_manager.hpp"
#include "relativity/core/profile.hpp"

int main() {
    try {
        GameManager game;
        if (!game.init()) {
            return 1;
        }

        {
            // Profile the entire application run
            PROFILE_SCOPE("main");
            game.run();
        }

        Profiling::Profiler::printStats(std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
