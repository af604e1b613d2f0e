#include <gtest/gtest.h>

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "export_envelope.hpp"
#include "transfer_codec.hpp"

using QrTransfer::TransferCodec;
using QrTransfer::Export::ExportEnvelope;

namespace {

nlohmann::json appState() {
    return nlohmann::json{
        {"calendar", {{"2025-01-01", nlohmann::json::array({{{"id", "1"}, {"title", "Test"}}})}}},
        {"workspace", {
            {"files", nlohmann::json::array({{{"id", "f1"}, {"name", "todo.md"}, {"content", "# Todo"}}})},
            {"folders", nlohmann::json::array({{{"id", "d1"}, {"name", "Notes"}}})}
        }},
        {"flashcards", {{"decks", nlohmann::json::array({{{"name", "Spanish"}}})}}},
        {"settings", {{"theme", "dark"}, {"accentColor", "#3b82f6"}, {"language", "en"}}}
    };
}

} // namespace

TEST(ExportEnvelopeTest, StampsExportTime) {
    const ExportEnvelope envelope("1.4.2", appState());
    EXPECT_EQ(envelope.export_version, ExportEnvelope::EXPORT_VERSION);
    EXPECT_EQ(envelope.app_version, "1.4.2");
    ASSERT_EQ(envelope.exported_at.size(), 20u); // YYYY-MM-DDTHH:MM:SSZ
    EXPECT_EQ(envelope.exported_at[4], '-');
    EXPECT_EQ(envelope.exported_at[10], 'T');
    EXPECT_EQ(envelope.exported_at.back(), 'Z');
}

TEST(ExportEnvelopeTest, JsonRoundTrip) {
    const ExportEnvelope envelope("1.4.2", appState());
    const nlohmann::json j = envelope.toJson();
    EXPECT_EQ(j.at("exportVersion"), 1);
    EXPECT_EQ(j.at("appVersion"), "1.4.2");
    EXPECT_EQ(j.at("data"), appState());

    const ExportEnvelope parsed = ExportEnvelope::fromJson(j);
    EXPECT_EQ(parsed.exported_at, envelope.exported_at);
    EXPECT_EQ(parsed.data, envelope.data);
}

TEST(ExportEnvelopeTest, LiteCopyKeepsCalendarAndSettingsOnly) {
    const ExportEnvelope envelope("1.4.2", appState());
    const ExportEnvelope lite = envelope.liteCopy();

    EXPECT_EQ(lite.data.at("calendar"), appState().at("calendar"));
    EXPECT_EQ(lite.data.at("settings"), appState().at("settings"));
    EXPECT_TRUE(lite.data.at("workspace").at("files").empty());
    EXPECT_TRUE(lite.data.at("workspace").at("folders").empty());
    EXPECT_TRUE(lite.data.at("flashcards").at("decks").empty());
    EXPECT_EQ(lite.exported_at, envelope.exported_at);

    // The original is untouched
    EXPECT_EQ(envelope.data.at("workspace").at("files").size(), 1u);
}

TEST(ExportEnvelopeTest, LiteExportSurvivesTransfer) {
    const nlohmann::json lite = ExportEnvelope("1.4.2", appState()).liteCopy().toJson();
    const auto value = TransferCodec::reassembleChunks(TransferCodec::compressAndChunk(lite));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, lite);
    EXPECT_EQ(ExportEnvelope::fromJson(*value).data.at("settings").at("theme"), "dark");
}

TEST(ExportEnvelopeTest, RejectsMissingFields) {
    nlohmann::json j = ExportEnvelope("1.4.2", appState()).toJson();
    j.erase("appVersion");
    EXPECT_THROW(ExportEnvelope::fromJson(j), std::runtime_error);
}

TEST(ExportEnvelopeTest, RejectsUnsupportedVersion) {
    nlohmann::json j = ExportEnvelope("1.4.2", appState()).toJson();
    j["exportVersion"] = 2;
    EXPECT_THROW(ExportEnvelope::fromJson(j), std::runtime_error);
}

TEST(ExportEnvelopeTest, RejectsNonObjectData) {
    nlohmann::json j = ExportEnvelope("1.4.2", appState()).toJson();
    j["data"] = nlohmann::json::array();
    EXPECT_THROW(ExportEnvelope::fromJson(j), std::runtime_error);
}
