#pragma once

#include <string>
#include <chrono> // For timestamps
#include <ctime>
#include <utility>

#include <nlohmann/json.hpp> // For JSON handling

namespace QrTransfer {
namespace Export {

// Wrapper the application puts around its state before handing it to the codec:
// {"exportVersion":1,"exportedAt":"...","appVersion":"...","data":{...}}
class ExportEnvelope {
public:
    static constexpr int EXPORT_VERSION = 1;

    int export_version = EXPORT_VERSION;
    std::string exported_at; // ISO 8601 format (e.g., "YYYY-MM-DDTHH:MM:SSZ")
    std::string app_version;
    nlohmann::json data = nlohmann::json::object(); // calendar, workspace, flashcards, settings

    // Default constructor
    ExportEnvelope() = default;

    // Constructor stamping the export time
    ExportEnvelope(std::string version, nlohmann::json payload)
        : app_version(std::move(version)),
          data(std::move(payload))
    {
        auto now = std::chrono::system_clock::now();
        std::time_t now_c = std::chrono::system_clock::to_time_t(now);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now_c));
        exported_at = buf;
    }

    // Convert ExportEnvelope object to nlohmann::json object
    nlohmann::json toJson() const;

    // Create ExportEnvelope object from nlohmann::json object.
    // Throws std::runtime_error on missing fields or an unsupported exportVersion.
    static ExportEnvelope fromJson(const nlohmann::json& j);

    // Copy carrying only calendar and settings: workspace files/folders and
    // flashcard decks are emptied to keep the number of QR codes small.
    ExportEnvelope liteCopy() const;
};

} // namespace Export
} // namespace QrTransfer
