#include "chunk_wire_codec.hpp"
#include <cstdint>
#include <iostream> // For logging
#include <limits>

namespace QrTransfer {
namespace Chunks {

void to_json(nlohmann::json& j, const Chunk& c) {
    j = nlohmann::json{
        {"v", c.version},
        {"i", c.index},
        {"t", c.total},
        {"h", c.fingerprint},
        {"d", c.slice}
    };
}

void from_json(const nlohmann::json& j, Chunk& c) {
    j.at("v").get_to(c.version);
    j.at("i").get_to(c.index);
    j.at("t").get_to(c.total);
    j.at("h").get_to(c.fingerprint);
    j.at("d").get_to(c.slice);
}

} // namespace Chunks

namespace Wire {

namespace {

bool isUnsigned32(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() &&
           it->is_number_unsigned() &&
           it->get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max();
}

bool isString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string();
}

} // namespace

std::string ChunkWireCodec::encode(const Chunks::Chunk& chunk) {
    nlohmann::json j = chunk; // Uses the to_json helper function
    return j.dump();
}

std::optional<Chunks::Chunk> ChunkWireCodec::decode(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Rejected scan (MalformedScan): not JSON (" << e.what() << ")" << std::endl;
        return std::nullopt;
    }

    if (!j.is_object()) {
        std::cerr << "Rejected scan: expected a JSON object" << std::endl;
        return std::nullopt;
    }
    if (!isUnsigned32(j, "v") || !isUnsigned32(j, "i") || !isUnsigned32(j, "t")) {
        std::cerr << "Rejected scan: v, i and t must be unsigned integers" << std::endl;
        return std::nullopt;
    }
    if (!isString(j, "h") || !isString(j, "d")) {
        std::cerr << "Rejected scan: h and d must be strings" << std::endl;
        return std::nullopt;
    }

    return j.get<Chunks::Chunk>(); // Uses the from_json helper function
}

} // namespace Wire
} // namespace QrTransfer
