/**
 * @file main.cpp
 * @brief Main entry point for media-relay
 *
 * Low-memory streaming transfers with container-aware memory monitoring.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "media_relay.hpp"
#include "cli/CommandLineInterface.hpp"
#include <iostream>

using namespace relay;

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}

// Example usage commands:
//
// Stream a remote object to disk in 512 KiB chunks:
// ./media-relay download --url https://peer/media/movie.mkv --output /data/movie.mkv
//
// Parallel upload with six workers:
// ./media-relay upload --input /data/movie.mkv --url https://peer/upload --workers 6
//
// Watch memory in a 512 MB container:
// ./media-relay monitor --interval 60 --diagnostic-log /var/log/memory_debug.log
