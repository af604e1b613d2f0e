#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunk.hpp"

namespace QrTransfer {
namespace Chunks {

// nlohmann/json hooks, using the one-letter wire keys v, i, t, h, d
void to_json(nlohmann::json& j, const Chunk& c);
void from_json(const nlohmann::json& j, Chunk& c);

} // namespace Chunks

namespace Wire {

// Text carried by a single QR symbol
class ChunkWireCodec {
public:
    // Compact JSON object, e.g. {"d":"H4sI...","h":"00k2x9qa","i":1,"t":3,"v":1}
    static std::string encode(const Chunks::Chunk& chunk);

    // Accepts only a JSON object whose v, i and t are unsigned 32-bit integers and
    // whose h and d are strings. Garbage scans and codes from other applications
    // return std::nullopt; nothing is partially accepted.
    static std::optional<Chunks::Chunk> decode(const std::string& text);
};

} // namespace Wire
} // namespace QrTransfer
