#include "export_envelope.hpp"
#include <stdexcept> // For std::runtime_error

namespace QrTransfer {
namespace Export {

// Helper to make JSON serialization/deserialization easier using nlohmann/json hooks
void to_json(nlohmann::json& j, const ExportEnvelope& e) {
    j = nlohmann::json{
        {"exportVersion", e.export_version},
        {"exportedAt", e.exported_at},
        {"appVersion", e.app_version},
        {"data", e.data}
    };
}

void from_json(const nlohmann::json& j, ExportEnvelope& e) {
    j.at("exportVersion").get_to(e.export_version);
    j.at("exportedAt").get_to(e.exported_at);
    j.at("appVersion").get_to(e.app_version);
    e.data = j.at("data");
}

nlohmann::json ExportEnvelope::toJson() const {
    return *this; // Uses the to_json helper function
}

ExportEnvelope ExportEnvelope::fromJson(const nlohmann::json& j) {
    ExportEnvelope envelope;
    try {
        j.get_to(envelope); // Uses the from_json helper function
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid export envelope: ") + e.what());
    }
    if (envelope.export_version != EXPORT_VERSION) {
        throw std::runtime_error("Unsupported export version " + std::to_string(envelope.export_version));
    }
    if (!envelope.data.is_object()) {
        throw std::runtime_error("Export envelope data must be an object");
    }
    return envelope;
}

ExportEnvelope ExportEnvelope::liteCopy() const {
    if (!data.is_object()) {
        throw std::runtime_error("Export envelope data must be an object");
    }
    ExportEnvelope lite = *this;
    lite.data["workspace"] = nlohmann::json{
        {"files", nlohmann::json::array()},
        {"folders", nlohmann::json::array()}
    };
    lite.data["flashcards"] = nlohmann::json{{"decks", nlohmann::json::array()}};
    return lite;
}

} // namespace Export
} // namespace QrTransfer
