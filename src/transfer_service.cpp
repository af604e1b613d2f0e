#include "transfer_service.hpp"
#include "export_envelope.hpp"
#include "transfer_codec.hpp"
#include "transfer_error.hpp"
#include <iostream> // For logging
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace QrTransfer {
namespace Service {

namespace {

crow::response jsonResponse(int code, const nlohmann::json& body) {
    crow::response res(code, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

nlohmann::json progressToJson(const Session::ScanProgress& progress) {
    return nlohmann::json{
        {"state", Session::toString(progress.state)},
        {"fingerprint", progress.fingerprint},
        {"total", progress.total},
        {"received", progress.received},
        {"missing", progress.missing}
    };
}

} // namespace

void registerRoutes(crow::SimpleApp& app, const Config::ChunkConfig& config,
                    std::shared_ptr<Session::ScanSession> session) {
    // --- POST /exports: Chunk a JSON value for QR rendering ---
    // Body is any JSON value. With ?lite=1 the body must be an export envelope and
    // workspace files and flashcards are stripped before chunking.
    CROW_ROUTE(app, "/exports").methods("POST"_method)
    ([config](const crow::request& req) {
        nlohmann::json data;
        try {
            data = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::parse_error& e) {
            return crow::response(400, std::string("Bad Request: body is not JSON: ") + e.what());
        }

        try {
            if (req.url_params.get("lite") != nullptr) {
                data = Export::ExportEnvelope::fromJson(data).liteCopy().toJson();
            }

            std::vector<Chunks::Chunk> chunks = TransferCodec::compressAndChunk(
                data, Config::ChunkConfig::MAX_CHUNK_SIZE, config.recommended_max_chunks);

            nlohmann::json wire = nlohmann::json::array();
            for (const auto& chunk : chunks) {
                wire.push_back(TransferCodec::encodeChunkToWire(chunk));
            }

            nlohmann::json body{
                {"total", chunks.size()},
                {"size", TransferCodec::reportedSize(chunks)},
                {"chunks", wire}
            };
            if (chunks.size() > config.recommended_max_chunks) {
                body["warning"] = "Export needs " + std::to_string(chunks.size()) +
                                  " QR codes; consider a lite export or a JSON file instead.";
            }
            return jsonResponse(200, body);
        } catch (const std::exception& e) {
            std::cerr << "Error exporting payload: " << e.what() << std::endl;
            return crow::response(400, std::string("Bad Request: ") + e.what());
        }
    });

    // --- POST /scans: Feed one scanned QR text into the session ---
    CROW_ROUTE(app, "/scans").methods("POST"_method)
    ([session](const crow::request& req) {
        std::optional<Chunks::Chunk> chunk = TransferCodec::decodeChunkFromWire(req.body);
        if (!chunk) {
            nlohmann::json body = progressToJson(session->progress());
            body["outcome"] = Session::toString(Session::ScanOutcome::Rejected);
            body["error"] = toString(TransferError::MalformedScan);
            return jsonResponse(422, body);
        }

        const Session::ScanOutcome outcome = session->accept(*chunk);

        nlohmann::json body = progressToJson(session->progress());
        body["outcome"] = Session::toString(outcome);
        return jsonResponse(outcome == Session::ScanOutcome::Rejected ? 422 : 200, body);
    });

    // --- GET /scans: Current scan progress ---
    CROW_ROUTE(app, "/scans").methods("GET"_method)
    ([session]() {
        return jsonResponse(200, progressToJson(session->progress()));
    });

    // --- GET /scans/payload: Reassemble the collected chunks ---
    CROW_ROUTE(app, "/scans/payload").methods("GET"_method)
    ([session]() {
        const Session::ScanProgress progress = session->progress();
        if (progress.state != Session::ScanState::Complete) {
            return jsonResponse(409, progressToJson(progress));
        }

        Chunks::ReassemblyResult result = session->reassemble();
        if (!result.ok()) {
            return jsonResponse(422, nlohmann::json{{"error", toString(result.error)}});
        }
        return jsonResponse(200, *result.value);
    });

    // --- DELETE /scans: Cancel the current scan ---
    CROW_ROUTE(app, "/scans").methods("DELETE"_method)
    ([session]() {
        session->reset();
        return crow::response(204);
    });
}

} // namespace Service
} // namespace QrTransfer
