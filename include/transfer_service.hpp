#pragma once

#include <memory>

#include <crow.h>

#include "chunk_config.hpp"
#include "scan_session.hpp"

namespace QrTransfer {
namespace Service {

// Registers the export and scan routes on app:
//   POST /exports[?lite=1], POST /scans, GET /scans, GET /scans/payload, DELETE /scans
// The routes keep a copy of config and share session with the caller.
void registerRoutes(crow::SimpleApp& app, const Config::ChunkConfig& config,
                    std::shared_ptr<Session::ScanSession> session);

} // namespace Service
} // namespace QrTransfer
