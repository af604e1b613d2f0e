// main.cpp
#include <iostream>
#include <string>
#include <filesystem>
#include <memory> // For std::make_shared

// Crow includes
#include <crow.h>

// Our project includes
#include "chunk_config.hpp"
#include "scan_session.hpp"
#include "transfer_service.hpp"

namespace fs = std::filesystem;
using QrTransfer::Config::ChunkConfig;

int main(int argc, char* argv[]) {
    // Settings file: first argument, or qr_transfer.json in the working directory
    const fs::path config_path = argc > 1 ? fs::path(argv[1]) : fs::path(ChunkConfig::DEFAULT_CONFIG_FILE_NAME);

    ChunkConfig config;
    try {
        config = ChunkConfig::loadOrDefault(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        return 1;
    }

    // Shared scan session captured by the import routes.
    // Scanning one export at a time is the expected flow; a new export resets it.
    auto session = std::make_shared<QrTransfer::Session::ScanSession>(config.max_chunk_count);

    // --- Crow Application Setup ---
    crow::SimpleApp app;
    QrTransfer::Service::registerRoutes(app, config, session);

    std::cout << "Starting QR transfer service on port " << config.port << "..." << std::endl;
    app.port(config.port).multithreaded().run();

    return 0;
}
